#pragma once
#include <optional>
#include <string>

#include <ext/log/logger.hpp>
#include <ext/smime/certificates.hpp>
#include <ext/smime/config.hpp>
#include <ext/smime/signer.hpp>
#include <ext/smime/transport.hpp>
#include <ext/smime/mail/message.hpp>

namespace ext::smime
{
	/// Mailer that signs and/or encrypts messages with S/MIME and sends them via given transport.
	///
	/// Certificates and keys are not checked when set, they are loaded by signer on each send,
	/// any error there is thrown out of send.
	/// Configuration should not be changed concurrently with send, there is no internal locking.
	class smime_mailer
	{
	private:
		ext::log::logger * m_log = nullptr;
		mail_transport * m_transport = nullptr;
		signer_factory m_signer_factory;

		encryption_certificates m_encrypting_certs;
		signing_identity m_signing;
		signer_options m_options;
		signer_options m_default_options;

	public:
		void set_logger(ext::log::logger * logger) { m_log = logger; }
		auto get_logger() const { return m_log; }

	public:
		/// sets recipient certificates, std::monostate disables encryption
		smime_mailer & set_encrypting_certs(encryption_certificates certs);
		/// sets sender certificate, std::nullopt disables signing(if key is not set either)
		smime_mailer & set_signing_cert(std::optional<pem_source> cert);
		/// sets sender private key and it's passphrase, absent passphrase is stored as empty string
		smime_mailer & set_signing_key(std::optional<pem_source> key, std::optional<std::string> passphrase = std::nullopt);
		/// sets signer options, empty options are replaced with default ones
		smime_mailer & set_signer_options(signer_options options = {});

		const encryption_certificates & encrypting_certs() const noexcept { return m_encrypting_certs; }
		const signing_identity        & signing()          const noexcept { return m_signing; }
		const signer_options          & options()          const noexcept { return m_options; }
		const signer_options          & default_options()  const noexcept { return m_default_options; }

	public:
		/// Seals message and hands it to transport, single attempt, no retries.
		/// Rejected recipients are written into msg.failed_recipients.
		/// Returns true if at least one recipient accepted message, false otherwise(including no recipients at all).
		/// Sealing errors(bad certificates, keys, passphrase, options) are thrown,
		/// transport exceptions are logged and all recipients of failed copy are counted as rejected
		bool send(mail::message & msg);

	public:
		smime_mailer(const smime_mailer &) = delete;
		smime_mailer & operator =(const smime_mailer &) = delete;

	public:
		/// factory must not be empty, throws smime_error otherwise
		smime_mailer(mail_transport & transport, const mailer_config & config, signer_factory factory, ext::log::logger * log = nullptr);
		/// uses openssl_smime_signer
		smime_mailer(mail_transport & transport, const mailer_config & config = {}, ext::log::logger * log = nullptr);
	};
}
