#pragma once
#include <istream>
#include <optional>
#include <string>

#include <ext/smime/certificates.hpp>
#include <ext/smime/signer.hpp>

namespace ext::smime
{
	/// smime_mailer configuration
	struct mailer_config
	{
		encryption_certificates encrypting_certs;
		std::optional<pem_source> signing_cert;
		std::optional<pem_source> signing_key;
		std::optional<std::string> signing_key_passphrase;

		// signer options of mailer, default_options are used if empty
		signer_options options;
		// process-wide default signer options
		signer_options default_options;
	};

	/// parses ini configuration:
	///   [signing]
	///   # sender certificate, private key and it's passphrase
	///   cert = path
	///   key = path
	///   passphrase = secret
	///
	///   [encrypting]
	///   # repeatable, certificate list
	///   cert = path
	///   # repeatable, certificate per recipient address
	///   recipient = addr:path
	///
	///   [options]
	///   # any number, goes to default_options as is
	///   name = value
	///
	/// Throws smime_error on parse errors, unknown options, mixing encrypting.cert and encrypting.recipient
	mailer_config parse_config(std::istream & is);
	/// loads configuration from file, see parse_config
	mailer_config load_config(const std::string & path);
}
