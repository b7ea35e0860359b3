#pragma once
#include <ctime>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ext::smime::mail
{
	/// max line length, excluding \r\n, of encoded body lines
	constexpr std::size_t MailDefaultLineSize = 76;
	/// max line length, excluding \r\n, allowed by RFC 5322
	constexpr std::size_t MailMaxLineSize = 998;

	struct mail_attachment
	{
		// all strings must be in utf-8

		std::string name;
		std::string content;
		std::string content_type = "application/octet-stream";
	};

	struct message
	{
		// all strings must be in utf-8

		std::string from;
		std::string reply_to;

		std::vector<std::string> recipients;
		std::vector<std::string> cc_recipients;
		std::vector<std::string> bcc_recipients;

		std::string subject;
		std::string body;
		std::string content_type = "text/plain";

		std::vector<mail_attachment> attachments;

		// recipients rejected by transport on last send, written by smime_mailer::send
		std::vector<std::string> failed_recipients;
	};

	/// envelope recipients: to, cc and bcc addresses without display names,
	/// duplicates(compared by normalized address) are dropped, first occurrence order is preserved
	std::vector<std::string> envelope_recipients(const message & msg);

	/// converts lone \n and \r into \r\n
	std::string normalize_newlines(std::string_view text);

	/// writes top level headers: Date, Message-ID, From, Reply-To, To, Cc, Subject.
	/// Bcc is never written. MIME-Version is not written, it belongs to body entity writers.
	/// Non ascii Subject is folded into RFC 2047 encoded-words.
	/// Throws smime_error if From, Reply-To, To, Cc or Subject contains CR or LF
	void write_headers(std::ostream & os, const message & msg, std::time_t date = std::time(nullptr));

	/// writes MIME entity of message body: Content-Type, Content-Transfer-Encoding headers, empty line and encoded body,
	/// multipart/mixed with attachments if there are any. This is the part which gets signed/encrypted
	void write_body_entity(std::ostream & os, const message & msg);

	/// writes whole unsealed message: headers, MIME-Version and body entity
	void write_message(std::ostream & os, const message & msg);
}
