#pragma once
#include <optional>
#include <string>
#include <vector>

#include <ext/log/logger.hpp>
#include <ext/smime/signer.hpp>

namespace ext::smime
{
	/// openssl_smime_signer settings parsed from signer_options.
	///
	/// Recognized option names:
	///  * sign_flags    - CMS flags for signing, see cms::parse_flags, default CMS_DETACHED
	///  * encrypt_flags - CMS flags for encrypting, see cms::parse_flags, default none
	///  * cipher        - openssl cipher name for encrypting, default aes-256-cbc
	///  * digest        - openssl digest name for signing, default is chosen by openssl
	///  * extra_certs   - ';' separated paths of certificates to include into signature
	struct openssl_signer_settings
	{
		unsigned sign_flags;
		unsigned encrypt_flags;
		std::string cipher;
		std::string digest;
		std::vector<pem_source> extra_certs;
	};

	/// parses options, throws smime_error on unknown option names or bad values
	openssl_signer_settings parse_openssl_signer_options(const signer_options & options);


	/// smime_signer implemented with openssl CMS functions.
	/// Message is signed first, then encrypted
	class openssl_smime_signer : public smime_signer
	{
	private:
		ext::log::logger * m_log = nullptr;
		signer_options m_options;

		std::optional<signing_identity> m_identity;
		encryption_certificates m_encrypt_certs;

	private:
		std::string sign(const std::string & entity, const openssl_signer_settings & settings);
		std::vector<sealed_message> encrypt(const mail::message & msg, const std::string & headers, const std::string & entity,
		                                    const openssl_signer_settings & settings);

	public:
		void set_logger(ext::log::logger * logger) { m_log = logger; }
		auto get_logger() const { return m_log; }

	public:
		void set_sign_certificate(const signing_identity & identity) override;
		void set_encrypt_certificates(const encryption_certificates & certs) override;
		std::vector<sealed_message> seal(const mail::message & msg) override;

	public:
		openssl_smime_signer(signer_options options = {}, ext::log::logger * log = nullptr)
			: m_log(log), m_options(std::move(options)) {}
	};

	/// signer_factory creating openssl_smime_signer objects with given logger
	signer_factory make_openssl_signer_factory(ext::log::logger * log = nullptr);
}
