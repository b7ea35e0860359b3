#include <ext/log/logging_macros.hpp>

#include <ext/smime/mailer.hpp>
#include <ext/smime/errors.hpp>
#include <ext/smime/openssl.hpp>
#include <ext/smime/openssl_signer.hpp>

namespace ext::smime
{
	smime_mailer::smime_mailer(mail_transport & transport, const mailer_config & config, signer_factory factory, ext::log::logger * log)
		: m_log(log), m_transport(&transport), m_signer_factory(std::move(factory)),
		  m_default_options(config.default_options)
	{
		if (not m_signer_factory)
			throw smime_error("ext::smime::smime_mailer: empty signer factory");

		set_encrypting_certs(config.encrypting_certs);
		set_signing_cert(config.signing_cert);
		set_signing_key(config.signing_key, config.signing_key_passphrase);
		set_signer_options(config.options);
	}

	smime_mailer::smime_mailer(mail_transport & transport, const mailer_config & config, ext::log::logger * log)
		: smime_mailer(transport, config, make_openssl_signer_factory(log), log)
	{

	}

	smime_mailer & smime_mailer::set_encrypting_certs(encryption_certificates certs)
	{
		m_encrypting_certs = std::move(certs);
		return *this;
	}

	smime_mailer & smime_mailer::set_signing_cert(std::optional<pem_source> cert)
	{
		m_signing.certificate = std::move(cert);
		return *this;
	}

	smime_mailer & smime_mailer::set_signing_key(std::optional<pem_source> key, std::optional<std::string> passphrase)
	{
		m_signing.private_key = std::move(key);
		m_signing.passphrase = passphrase ? std::move(*passphrase) : std::string();
		return *this;
	}

	smime_mailer & smime_mailer::set_signer_options(signer_options options)
	{
		m_options = options.empty() ? m_default_options : std::move(options);
		return *this;
	}

	bool smime_mailer::send(mail::message & msg)
	{
		EXTLOG_INFO(m_log, "smime_mailer: sending message from " << msg.from << ", subject \"" << msg.subject << "\"");

		msg.failed_recipients.clear();

		// fresh signer each time, nothing is shared between sends
		auto signer = m_signer_factory(m_options);
		if (not signer)
			throw smime_error("ext::smime::smime_mailer::send: signer factory returned null signer");

		if (not m_signing.empty())
			signer->set_sign_certificate(m_signing);

		if (not empty(m_encrypting_certs))
			signer->set_encrypt_certificates(m_encrypting_certs);

		std::vector<sealed_message> sealed;
		try
		{
			sealed = signer->seal(msg);
		}
		catch (std::exception & ex)
		{
			EXTLOG_ERROR(m_log, "smime_mailer: sealing failed: " << ex.what());

			auto queue = openssl::print_error_queue();
			if (not queue.empty())
			{
				EXTLOG_ERROR(m_log, "smime_mailer: openssl errors:\n" << queue);
			}

			throw;
		}

		std::size_t accepted = 0;
		std::vector<std::string> failed;
		for (auto & part : sealed)
		{
			// delivery failure is reported through result, not thrown
			try
			{
				accepted += m_transport->send(part, failed);
			}
			catch (std::exception & ex)
			{
				EXTLOG_ERROR(m_log, "smime_mailer: transport failure: " << ex.what());
				failed.insert(failed.end(), part.recipients.begin(), part.recipients.end());
			}
		}

		msg.failed_recipients = std::move(failed);

		if (not msg.failed_recipients.empty())
		{
			EXTLOG_WARN(m_log, "smime_mailer: " << msg.failed_recipients.size() << " recipient(s) rejected message");
			for (auto & addr : msg.failed_recipients)
			{
				EXTLOG_WARN(m_log, "smime_mailer: rejected " << addr);
			}
		}

		EXTLOG_INFO(m_log, "smime_mailer: message accepted by " << accepted << " recipient(s)");

		// no accepting recipients at all is a failure, even when there was no recipients
		return accepted != 0;
	}
}
