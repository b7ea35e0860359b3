#pragma once
#include <string>
#include <string_view>
#include <ext/smime/openssl.hpp>

struct evp_md_st;
typedef evp_md_st EVP_MD;

namespace ext::smime::cms
{
	/// parses CMS flags from string: '|' separated openssl flag names, like "CMS_DETACHED | CMS_BINARY",
	/// or a number in decimal/hex notation. Empty string gives 0.
	/// Throws smime_error on unknown flag names
	unsigned parse_flags(std::string_view str);
	/// prints flags as '|' separated openssl flag names, unknown bits are printed as hex number
	std::string format_flags(unsigned flags);

	/// signs MIME entity with given private key, x509 certificate and with additional certificates to be included into signature.
	/// Result is S/MIME entity: multipart/signed if flags contain CMS_DETACHED, application/pkcs7-mime otherwise.
	/// md can be null - openssl default digest is used then.
	/// Lines of result are terminated with \r\n
	std::string sign_entity(EVP_PKEY * pkey, X509 * x509, stack_st_X509 * additional_certs, const EVP_MD * md,
	                        std::string_view entity, unsigned flags);

	/// encrypts MIME entity for given recipient certificates with given cipher.
	/// Result is S/MIME application/pkcs7-mime; smime-type=enveloped-data entity.
	/// Lines of result are terminated with \r\n
	std::string encrypt_entity(stack_st_X509 * recipients, const EVP_CIPHER * cipher, std::string_view entity, unsigned flags);
}
