#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_set>

#include <ext/base64.hpp>
#include <ext/time_fmt.hpp>

#include <boost/uuid/uuid.hpp> // for mime boundaries and message ids
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <ext/smime/mail/message.hpp>
#include <ext/smime/mail/address.hpp>
#include <ext/smime/errors.hpp>

namespace ext::smime::mail
{
	std::vector<std::string> envelope_recipients(const message & msg)
	{
		std::vector<std::string> result;
		std::unordered_set<std::string> seen;

		auto add = [&](const std::vector<std::string> & addrs)
		{
			for (auto & addr : addrs)
			{
				auto normalized = normalize_addr(addr);
				if (normalized.empty()) continue;
				if (not seen.insert(std::move(normalized)).second) continue;

				result.emplace_back(extract_addr(addr));
			}
		};

		add(msg.recipients);
		add(msg.cc_recipients);
		add(msg.bcc_recipients);

		return result;
	}

	std::string normalize_newlines(std::string_view text)
	{
		std::string result;
		result.reserve(text.size() + text.size() / 32);

		auto first = text.begin();
		auto last  = text.end();
		for (; first != last; ++first)
		{
			auto ch = *first;
			if (ch == '\r')
			{
				// \r\n stays as is, lone \r becomes \r\n
				if (first + 1 != last and first[1] == '\n') ++first;
				result += "\r\n";
			}
			else if (ch == '\n')
				result += "\r\n";
			else
				result += ch;
		}

		return result;
	}

	static bool is_ascii(std::string_view str)
	{
		return std::all_of(str.begin(), str.end(), [](char ch) { return static_cast<unsigned char>(ch) < 128; });
	}

	/// checks that text is valid for 7bit Content-Transfer-Encoding:
	/// ascii only, no control characters except tab, lines no longer MailMaxLineSize
	static bool check_7bit_valid(std::string_view text)
	{
		const auto is_valid_char = [](char ch) { return ch == '\t' or (ch >= 32 and ch < 127); };
		const std::string_view crln = "\r\n";

		for (;;)
		{
			auto pos = text.find(crln);
			auto line = text.substr(0, pos);

			if (line.size() > MailMaxLineSize) return false;
			if (not std::all_of(line.begin(), line.end(), is_valid_char)) return false;

			if (pos == text.npos) break;
			text.remove_prefix(pos + crln.size());
		}

		return true;
	}

	/// number of bytes not greater than count, which does not split utf-8 sequence in text
	static std::size_t utf8_trunc_count(std::string_view text, std::size_t count)
	{
		if (count >= text.size()) return text.size();

		// continuation bytes are 10xxxxxx
		while (count and (static_cast<unsigned char>(text[count]) & 0xC0) == 0x80)
			--count;

		return count;
	}

	/// Writes header value as RFC 2047 base64 encoded-words, if it's not ascii, as is otherwise.
	/// Encoded-words are split on utf-8 character boundaries and folded with \r\n<space>,
	/// so every line, including the one with header name, fits into MailDefaultLineSize.
	/// Nothing is written after last encoded-word
	static void write_encoded_header_value(std::ostream & os, std::string_view value, std::size_t namewidth)
	{
		if (is_ascii(value))
		{
			os << value;
			return;
		}

		const std::string_view prefix = "=?utf-8?b?";
		const std::string_view suffix = "?=";
		const std::string_view linebreak = "\r\n ";
		// RFC 2047: encoded-word is no longer 75 characters
		constexpr std::size_t MaxEncodedWordSize = 75;
		constexpr std::size_t MaxEncodedWordPayload = (MaxEncodedWordSize - 10 - 2) / 4 * 3;

		// header name with ": " is already written
		std::size_t cur_pos = namewidth + 2;
		bool first_word = true;
		std::string encoded;

		while (not value.empty())
		{
			if (not first_word)
			{
				os << linebreak;
				cur_pos = 1;
			}

			std::size_t avail = MailDefaultLineSize - std::min(MailDefaultLineSize, cur_pos + prefix.size() + suffix.size());
			std::size_t count = utf8_trunc_count(value, std::min(avail / 4 * 3, MaxEncodedWordPayload));

			if (count == 0)
			{
				// nothing fits after long header name, start from next line
				if (first_word)
				{
					first_word = false;
					continue;
				}

				// broken utf-8 sequence, encode bytes as is
				count = std::min(value.size(), MaxEncodedWordPayload);
			}

			encoded.clear();
			ext::encode_base64(value.substr(0, count), encoded);
			os << prefix << encoded << suffix;

			value.remove_prefix(count);
			first_word = false;
		}
	}

	/// header values are written as is, \r or \n in them would start new header
	static void check_header_value(std::string_view name, std::string_view value)
	{
		if (value.find_first_of("\r\n") != value.npos)
			throw smime_error("ext::smime::mail::write_headers: " + std::string(name) + " header value contains CR or LF");
	}

	/// RFC 2231 encoded filename parameter if name is not ascii, quoted filename otherwise
	static std::string encode_filename_parameter(std::string_view name)
	{
		std::string result;
		if (is_ascii(name))
		{
			result = "filename=\"";
			for (char ch : name)
			{
				if (ch == '"' or ch == '\\') result += '\\';
				result += ch;
			}

			result += '"';
			return result;
		}

		const char hex[] = "0123456789ABCDEF";
		result = "filename*=utf-8''";
		for (char ch : name)
		{
			auto uch = static_cast<unsigned char>(ch);
			if (std::isalnum(uch) or uch == '.' or uch == '-' or uch == '_')
				result += ch;
			else
			{
				result += '%';
				result += hex[uch >> 4];
				result += hex[uch & 0x0F];
			}
		}

		return result;
	}

	static void write_base64_lines(std::ostream & os, std::string_view content)
	{
		std::string encoded;
		ext::encode_base64(content, encoded);
		std::string_view view = encoded;

		while (not view.empty())
		{
			auto line = view.substr(0, MailDefaultLineSize);
			os << line << "\r\n";
			view.remove_prefix(line.size());
		}
	}

	static void write_address_header(std::ostream & os, std::string_view name, const std::vector<std::string> & values)
	{
		if (values.empty()) return;
		for (auto & value : values)
			check_header_value(name, value);

		auto ident = name.size() + 2;
		std::string sepr = ",\r\n";
		sepr.append(ident, ' ');

		os << name << ": " << values.front();
		for (auto it = values.begin() + 1; it != values.end(); ++it)
			os << sepr << *it;

		os << "\r\n";
	}

	static void write_date_header(std::ostream & os, std::time_t time)
	{
		// Sat, 30 May 2015 23:15:00 +0000
		constexpr unsigned buffer_size = 64;
		char buffer[buffer_size];

		std::tm struct_tm;
		ext::gmtime(&time, &struct_tm);
		auto printed = std::strftime(buffer, buffer_size, "%a, %d %b %Y %H:%M:%S +0000", &struct_tm);

		os << "Date: ";
		os.write(buffer, printed);
		os << "\r\n";
	}

	static std::string generate_uuid()
	{
		return to_string(boost::uuids::random_generator()());
	}

	static std::string generate_mime_bounary()
	{
		return "==" + generate_uuid();
	}

	static std::string message_id_domain(const message & msg)
	{
		auto addr = extract_addr(msg.from);
		auto pos = addr.rfind('@');
		if (pos == addr.npos or pos + 1 == addr.size()) return "localhost";

		return std::string(addr.substr(pos + 1));
	}

	void write_headers(std::ostream & os, const message & msg, std::time_t date)
	{
		check_header_value("From", msg.from);
		check_header_value("Reply-To", msg.reply_to);
		check_header_value("Subject", msg.subject);

		write_date_header(os, date);
		os << "Message-ID: <" << generate_uuid() << "@" << message_id_domain(msg) << ">\r\n";
		os << "From: " << msg.from << "\r\n";

		if (not msg.reply_to.empty())
			os << "Reply-To: " << msg.reply_to << "\r\n";

		write_address_header(os, "To", msg.recipients);
		write_address_header(os, "Cc", msg.cc_recipients);

		os << "Subject: ";
		write_encoded_header_value(os, msg.subject, std::strlen("Subject"));
		os << "\r\n";
	}

	static void write_attachment(std::ostream & os, const mail_attachment & attachment)
	{
		os << "Content-Type: " << attachment.content_type << "\r\n";
		os << "Content-Transfer-Encoding: base64\r\n";
		os << "Content-Disposition: attachment; " << encode_filename_parameter(attachment.name) << "\r\n";
		os << "\r\n";

		write_base64_lines(os, attachment.content);
	}

	static void write_single_body(std::ostream & os, const message & msg)
	{
		auto body = normalize_newlines(msg.body);

		os << "Content-Type: " << msg.content_type << "; charset=utf-8\r\n";
		if (check_7bit_valid(body))
		{
			os << "Content-Transfer-Encoding: 7bit\r\n";
			os << "\r\n";
			os << body;
			if (body.size() < 2 or body.compare(body.size() - 2, 2, "\r\n") != 0)
				os << "\r\n";
		}
		else
		{
			os << "Content-Transfer-Encoding: base64\r\n";
			os << "\r\n";
			write_base64_lines(os, body);
		}
	}

	static void write_multipart_body(std::ostream & os, const message & msg)
	{
		std::string boundary = generate_mime_bounary();

		/// шапка multipart/mixed
		os << "Content-Type: multipart/mixed; boundary=\"" << boundary << "\"\r\n";
		os << "\r\nThis is a multi-part message in MIME format.\r\n";

		boundary.insert(0, "--");

		os << boundary << "\r\n";
		write_single_body(os, msg);
		os << boundary;

		for (const auto & a : msg.attachments)
		{
			os << "\r\n";
			write_attachment(os, a);
			os << boundary;
		}

		os << "--\r\n";
	}

	void write_body_entity(std::ostream & os, const message & msg)
	{
		if (msg.attachments.empty())
			write_single_body(os, msg);
		else
			write_multipart_body(os, msg);
	}

	void write_message(std::ostream & os, const message & msg)
	{
		write_headers(os, msg);
		os << "MIME-Version: 1.0\r\n";
		write_body_entity(os, msg);
	}
}
