#include <sstream>

#include <openssl/cms.h>
#include <openssl/evp.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <ext/log/logging_macros.hpp>

#include <ext/smime/openssl_signer.hpp>
#include <ext/smime/cms.hpp>
#include <ext/smime/errors.hpp>
#include <ext/smime/mail/address.hpp>

namespace ext::smime
{
	static std::vector<pem_source> parse_extra_certs(const std::string & value)
	{
		std::vector<std::string> paths;
		boost::algorithm::split(paths, value, [](char ch) { return ch == ';'; });

		std::vector<pem_source> result;
		for (auto & path : paths)
		{
			boost::algorithm::trim(path);
			if (not path.empty())
				result.push_back(pem_source::from_file(std::move(path)));
		}

		return result;
	}

	static sealed_message make_sealed(const mail::message & msg, std::string data)
	{
		sealed_message sealed;
		sealed.from = mail::extract_addr(msg.from);
		sealed.recipients = mail::envelope_recipients(msg);
		sealed.data = std::move(data);
		return sealed;
	}

	openssl_signer_settings parse_openssl_signer_options(const signer_options & options)
	{
		openssl_signer_settings settings;
		settings.sign_flags = CMS_DETACHED;
		settings.encrypt_flags = 0;
		settings.cipher = "aes-256-cbc";

		for (auto & [name, value] : options)
		{
			if (name == "sign_flags")
				settings.sign_flags = cms::parse_flags(value);
			else if (name == "encrypt_flags")
				settings.encrypt_flags = cms::parse_flags(value);
			else if (name == "cipher")
				settings.cipher = boost::algorithm::trim_copy(value);
			else if (name == "digest")
				settings.digest = boost::algorithm::trim_copy(value);
			else if (name == "extra_certs")
				settings.extra_certs = parse_extra_certs(value);
			else
				throw smime_error("ext::smime::parse_openssl_signer_options: unknown option \"" + name + "\"");
		}

		return settings;
	}

	void openssl_smime_signer::set_sign_certificate(const signing_identity & identity)
	{
		m_identity = identity;
	}

	void openssl_smime_signer::set_encrypt_certificates(const encryption_certificates & certs)
	{
		m_encrypt_certs = certs;
	}

	std::string openssl_smime_signer::sign(const std::string & entity, const openssl_signer_settings & settings)
	{
		auto & identity = *m_identity;
		if (not identity.certificate)
			throw smime_error("ext::smime::openssl_smime_signer::sign: signing private key is set, but signing certificate is not");
		if (not identity.private_key)
			throw smime_error("ext::smime::openssl_smime_signer::sign: signing certificate is set, but signing private key is not");

		auto cert = load_certificate(*identity.certificate);
		auto pkey = load_private_key(*identity.private_key, identity.passphrase);

		if (not openssl::check_private_key(cert.get(), pkey.get()))
		{
			openssl::openssl_clear_errors();
			throw smime_error("ext::smime::openssl_smime_signer::sign: private key " + to_string(*identity.private_key) +
			                  " does not match certificate " + to_string(*identity.certificate));
		}

		openssl::stackof_x509_uptr extra_certs;
		if (not settings.extra_certs.empty())
		{
			extra_certs = openssl::make_x509_stack();
			for (auto & source : settings.extra_certs)
			{
				auto extra = load_certificate(source);
				openssl::push_certificate(extra_certs.get(), extra.get());
			}
		}

		const EVP_MD * md = nullptr;
		if (not settings.digest.empty())
		{
			md = ::EVP_get_digestbyname(settings.digest.c_str());
			if (not md) throw smime_error("ext::smime::openssl_smime_signer::sign: unknown digest " + settings.digest);
		}

		EXTLOG_DEBUG(m_log, "openssl_smime_signer: signing with " << openssl::subject_name(cert.get())
		             << ", flags = " << cms::format_flags(settings.sign_flags));

		return cms::sign_entity(pkey.get(), cert.get(), extra_certs.get(), md, entity, settings.sign_flags);
	}

	std::vector<sealed_message> openssl_smime_signer::encrypt(const mail::message & msg, const std::string & headers, const std::string & entity,
	                                                          const openssl_signer_settings & settings)
	{
		auto * cipher = openssl::cipher_by_name(settings.cipher);
		std::vector<sealed_message> result;

		auto encrypt_for = [&](const std::vector<const pem_source *> & sources)
		{
			auto stack = openssl::make_x509_stack();
			for (auto * source : sources)
			{
				auto cert = load_certificate(*source);
				openssl::push_certificate(stack.get(), cert.get());
			}

			return headers + cms::encrypt_entity(stack.get(), cipher, entity, settings.encrypt_flags);
		};

		if (auto * map = std::get_if<certificates_by_recipient>(&m_encrypt_certs))
		{
			// every recipient gets own copy, encrypted only with it's certificate
			std::string from(mail::extract_addr(msg.from));
			for (auto & addr : mail::envelope_recipients(msg))
			{
				auto it = map->certificates.find(mail::normalize_addr(addr));
				if (it == map->certificates.end())
					throw smime_error("ext::smime::openssl_smime_signer::encrypt: no encryption certificate for recipient " + addr);

				EXTLOG_DEBUG(m_log, "openssl_smime_signer: encrypting copy for " << addr << " with " << to_string(it->second)
				             << ", cipher = " << settings.cipher);

				auto data = encrypt_for({&it->second});
				result.push_back({from, {addr}, std::move(data)});
			}

			return result;
		}

		std::vector<const pem_source *> sources;
		if (auto * single = std::get_if<single_certificate>(&m_encrypt_certs))
			sources.push_back(&single->certificate);
		else if (auto * list = std::get_if<certificate_list>(&m_encrypt_certs))
			for (auto & cert : list->certificates) sources.push_back(&cert);

		EXTLOG_DEBUG(m_log, "openssl_smime_signer: encrypting with " << to_string(m_encrypt_certs)
		             << ", cipher = " << settings.cipher);

		result.push_back(make_sealed(msg, encrypt_for(sources)));
		return result;
	}

	std::vector<sealed_message> openssl_smime_signer::seal(const mail::message & msg)
	{
		auto settings = parse_openssl_signer_options(m_options);

		std::ostringstream headers_os, entity_os;
		mail::write_headers(headers_os, msg);
		mail::write_body_entity(entity_os, msg);

		auto headers = headers_os.str();
		auto entity = entity_os.str();

		bool signing = m_identity and not m_identity->empty();
		bool encrypting = not empty(m_encrypt_certs);

		if (not signing and not encrypting)
		{
			EXTLOG_DEBUG(m_log, "openssl_smime_signer: no certificates set, message is sent unsealed");

			std::vector<sealed_message> result;
			result.push_back(make_sealed(msg, headers + "MIME-Version: 1.0\r\n" + entity));
			return result;
		}

		// S/MIME output starts with it's own MIME-Version header
		if (signing)
			entity = sign(entity, settings);

		if (encrypting)
			return encrypt(msg, headers, entity, settings);

		std::vector<sealed_message> result;
		result.push_back(make_sealed(msg, headers + entity));
		return result;
	}

	signer_factory make_openssl_signer_factory(ext::log::logger * log)
	{
		return [log](const signer_options & options) -> std::unique_ptr<smime_signer>
		{
			return std::make_unique<openssl_smime_signer>(options, log);
		};
	}
}
