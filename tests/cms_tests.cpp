#include <boost/test/unit_test.hpp>

#include <openssl/cms.h>
#include <openssl/evp.h>

#include <ext/smime/cms.hpp>
#include <ext/smime/errors.hpp>
#include "test_pki.hpp"

using namespace ext::smime;

static const std::string test_entity =
	"Content-Type: text/plain; charset=utf-8\r\n"
	"Content-Transfer-Encoding: 7bit\r\n"
	"\r\n"
	"Hello, this is test entity\r\n";

BOOST_AUTO_TEST_SUITE(cms_tests)

BOOST_AUTO_TEST_CASE(parse_flags_test)
{
	BOOST_CHECK_EQUAL(cms::parse_flags(""), 0u);
	BOOST_CHECK_EQUAL(cms::parse_flags("CMS_DETACHED"), unsigned(CMS_DETACHED));
	BOOST_CHECK_EQUAL(cms::parse_flags(" CMS_DETACHED | CMS_BINARY "), unsigned(CMS_DETACHED | CMS_BINARY));
	BOOST_CHECK_EQUAL(cms::parse_flags("CMS_NOCERTS|0x40"), unsigned(CMS_NOCERTS | CMS_DETACHED));
	BOOST_CHECK_EQUAL(cms::parse_flags("128"), unsigned(CMS_BINARY));
	BOOST_CHECK_EQUAL(cms::parse_flags("CMS_NOSIGS"), unsigned(CMS_NO_CONTENT_VERIFY | CMS_NO_ATTR_VERIFY));

	BOOST_CHECK_THROW(cms::parse_flags("CMS_UNKNOWN"), smime_error);
	BOOST_CHECK_THROW(cms::parse_flags("CMS_DETACHED | detached"), smime_error);
	BOOST_CHECK_THROW(cms::parse_flags("12abc"), smime_error);
}

BOOST_AUTO_TEST_CASE(format_flags_test)
{
	BOOST_CHECK_EQUAL(cms::format_flags(0), "");
	BOOST_CHECK_EQUAL(cms::format_flags(CMS_DETACHED), "CMS_DETACHED");
	BOOST_CHECK_EQUAL(cms::format_flags(CMS_BINARY | CMS_DETACHED), "CMS_DETACHED | CMS_BINARY");
	BOOST_CHECK_EQUAL(cms::format_flags(CMS_NO_SIGNER_CERT_VERIFY), "CMS_NO_SIGNER_CERT_VERIFY");
	BOOST_CHECK_EQUAL(cms::format_flags(CMS_TEXT | 0x80000000u), "CMS_TEXT | 0x80000000");

	unsigned flags = CMS_NOCERTS | CMS_NOATTR | CMS_STREAM;
	BOOST_CHECK_EQUAL(cms::parse_flags(cms::format_flags(flags)), flags);
}

BOOST_AUTO_TEST_CASE(sign_detached_test)
{
	auto & pki = get_test_pki();

	auto result = cms::sign_entity(pki.sender.key.get(), pki.sender.cert.get(), nullptr, ::EVP_sha256(), test_entity, CMS_DETACHED);

	BOOST_CHECK(result.find("multipart/signed") != std::string::npos);
	// content is transferred as is
	BOOST_CHECK(result.find("Hello, this is test entity") != std::string::npos);

	auto content = verify_smime(result, pki.sender.cert.get());
	BOOST_CHECK_EQUAL(content, test_entity);

	BOOST_CHECK_THROW(verify_smime(result, pki.alice.cert.get()), std::system_error);
	openssl::openssl_clear_errors();
}

BOOST_AUTO_TEST_CASE(sign_opaque_test)
{
	auto & pki = get_test_pki();

	auto result = cms::sign_entity(pki.sender.key.get(), pki.sender.cert.get(), nullptr, nullptr, test_entity, 0);

	BOOST_CHECK(result.find("application/pkcs7-mime") != std::string::npos);
	BOOST_CHECK(result.find("signed-data") != std::string::npos);
	BOOST_CHECK(result.find("Hello, this is test entity") == std::string::npos);

	auto content = verify_smime(result, pki.sender.cert.get());
	BOOST_CHECK_EQUAL(content, test_entity);
}

BOOST_AUTO_TEST_CASE(sign_with_extra_certs_test)
{
	auto & pki = get_test_pki();

	auto extra = openssl::make_x509_stack();
	openssl::push_certificate(extra.get(), pki.alice.cert.get());

	auto result = cms::sign_entity(pki.sender.key.get(), pki.sender.cert.get(), extra.get(), nullptr, test_entity, CMS_DETACHED);
	BOOST_CHECK_EQUAL(verify_smime(result, pki.sender.cert.get()), test_entity);
}

BOOST_AUTO_TEST_CASE(encrypt_test)
{
	auto & pki = get_test_pki();

	auto recipients = openssl::make_x509_stack();
	openssl::push_certificate(recipients.get(), pki.alice.cert.get());

	auto result = cms::encrypt_entity(recipients.get(), ::EVP_aes_256_cbc(), test_entity, 0);

	BOOST_CHECK(result.find("enveloped-data") != std::string::npos);
	BOOST_CHECK(result.find("Hello, this is test entity") == std::string::npos);

	BOOST_CHECK_EQUAL(decrypt_smime(result, pki.alice.key.get(), pki.alice.cert.get()), test_entity);
	BOOST_CHECK_THROW(decrypt_smime(result, pki.bob.key.get(), pki.bob.cert.get()), std::system_error);
	openssl::openssl_clear_errors();
}

BOOST_AUTO_TEST_CASE(encrypt_multiple_recipients_test)
{
	auto & pki = get_test_pki();

	auto recipients = openssl::make_x509_stack();
	openssl::push_certificate(recipients.get(), pki.alice.cert.get());
	openssl::push_certificate(recipients.get(), pki.bob.cert.get());

	auto result = cms::encrypt_entity(recipients.get(), ::EVP_aes_128_cbc(), test_entity, 0);

	BOOST_CHECK_EQUAL(decrypt_smime(result, pki.alice.key.get(), pki.alice.cert.get()), test_entity);
	BOOST_CHECK_EQUAL(decrypt_smime(result, pki.bob.key.get(), pki.bob.cert.get()), test_entity);
	BOOST_CHECK_THROW(decrypt_smime(result, pki.sender.key.get(), pki.sender.cert.get()), std::system_error);
	openssl::openssl_clear_errors();
}

BOOST_AUTO_TEST_SUITE_END()
