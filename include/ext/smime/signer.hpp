#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <ext/smime/certificates.hpp>
#include <ext/smime/mail/message.hpp>

namespace ext::smime
{
	/// options for signer implementation, passed verbatim.
	/// Recognized names are defined by implementation, see openssl_smime_signer
	using signer_options = std::map<std::string, std::string>;

	/// message ready for transport
	struct sealed_message
	{
		std::string from;                    // envelope sender address
		std::vector<std::string> recipients; // envelope recipient addresses
		std::string data;                    // whole RFC 5322 message, lines are terminated with \r\n
	};

	/// Signing/encrypting context for a single send.
	/// Once certificates are set, seal turns a message into messages ready for transport:
	/// plain one if nothing was set, signed and/or encrypted otherwise.
	/// When encrypting per recipient, message is split into a copy per recipient.
	class smime_signer
	{
	public:
		virtual ~smime_signer() = default;

		/// sets sender certificate, private key and private key passphrase
		virtual void set_sign_certificate(const signing_identity & identity) = 0;
		/// sets recipient certificates
		virtual void set_encrypt_certificates(const encryption_certificates & certs) = 0;

		/// seals message. Certificates and keys are loaded here, errors are thrown as exceptions
		virtual std::vector<sealed_message> seal(const mail::message & msg) = 0;
	};

	/// creates fresh smime_signer with given options, called once per send
	using signer_factory = std::function<std::unique_ptr<smime_signer>(const signer_options & options)>;
}
