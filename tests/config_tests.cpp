#include <sstream>
#include <boost/test/unit_test.hpp>

#include <ext/smime/config.hpp>
#include <ext/smime/errors.hpp>
#include "test_pki.hpp"

using namespace ext::smime;

static mailer_config parse(const std::string & text)
{
	std::istringstream is(text);
	return parse_config(is);
}

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(empty_config_test)
{
	auto config = parse("");

	BOOST_CHECK(std::holds_alternative<std::monostate>(config.encrypting_certs));
	BOOST_CHECK(not config.signing_cert);
	BOOST_CHECK(not config.signing_key);
	BOOST_CHECK(not config.signing_key_passphrase);
	BOOST_CHECK(config.options.empty());
	BOOST_CHECK(config.default_options.empty());
}

BOOST_AUTO_TEST_CASE(signing_config_test)
{
	auto config = parse(
		"# sender identity\n"
		"[signing]\n"
		"cert = /etc/smime/sender.crt\n"
		"key = /etc/smime/sender.key\n"
		"passphrase = secret\n");

	BOOST_REQUIRE(config.signing_cert);
	BOOST_REQUIRE(config.signing_key);
	BOOST_REQUIRE(config.signing_key_passphrase);

	BOOST_CHECK(*config.signing_cert == pem_source::from_file("/etc/smime/sender.crt"));
	BOOST_CHECK(*config.signing_key == pem_source::from_file("/etc/smime/sender.key"));
	BOOST_CHECK_EQUAL(*config.signing_key_passphrase, "secret");
}

BOOST_AUTO_TEST_CASE(encrypting_list_config_test)
{
	auto single = parse(
		"[encrypting]\n"
		"cert = alice.crt\n");

	BOOST_REQUIRE(std::holds_alternative<single_certificate>(single.encrypting_certs));
	BOOST_CHECK(std::get<single_certificate>(single.encrypting_certs).certificate == pem_source::from_file("alice.crt"));

	auto list = parse(
		"[encrypting]\n"
		"cert = alice.crt\n"
		"cert = bob.crt\n");

	BOOST_REQUIRE(std::holds_alternative<certificate_list>(list.encrypting_certs));
	auto & certs = std::get<certificate_list>(list.encrypting_certs).certificates;
	BOOST_REQUIRE_EQUAL(certs.size(), 2u);
	BOOST_CHECK(certs[0] == pem_source::from_file("alice.crt"));
	BOOST_CHECK(certs[1] == pem_source::from_file("bob.crt"));
}

BOOST_AUTO_TEST_CASE(encrypting_recipient_config_test)
{
	auto config = parse(
		"[encrypting]\n"
		"recipient = Alice@Example.com : /certs/alice.crt\n"
		"recipient = bob@example.com:/certs/bob.crt\n");

	BOOST_REQUIRE(std::holds_alternative<certificates_by_recipient>(config.encrypting_certs));
	auto & map = std::get<certificates_by_recipient>(config.encrypting_certs).certificates;
	BOOST_REQUIRE_EQUAL(map.size(), 2u);
	BOOST_CHECK(map.at("alice@example.com") == pem_source::from_file("/certs/alice.crt"));
	BOOST_CHECK(map.at("bob@example.com") == pem_source::from_file("/certs/bob.crt"));
}

BOOST_AUTO_TEST_CASE(options_config_test)
{
	auto config = parse(
		"[options]\n"
		"cipher = aes-128-cbc\n"
		"sign_flags = CMS_DETACHED | CMS_BINARY\n");

	BOOST_CHECK(config.options.empty());
	BOOST_CHECK_EQUAL(config.default_options.size(), 2u);
	BOOST_CHECK_EQUAL(config.default_options.at("cipher"), "aes-128-cbc");
	BOOST_CHECK_EQUAL(config.default_options.at("sign_flags"), "CMS_DETACHED | CMS_BINARY");
}

BOOST_AUTO_TEST_CASE(bad_config_test)
{
	// unknown option
	BOOST_CHECK_THROW(parse("[signing]\ncertificate = sender.crt\n"), smime_error);
	BOOST_CHECK_THROW(parse("[delivery]\nhost = localhost\n"), smime_error);
	// both certificate list and per recipient certificates
	BOOST_CHECK_THROW(parse("[encrypting]\ncert = a.crt\nrecipient = bob@example.com:b.crt\n"), smime_error);
	// bad recipient entries
	BOOST_CHECK_THROW(parse("[encrypting]\nrecipient = bob.crt\n"), smime_error);
	BOOST_CHECK_THROW(parse("[encrypting]\nrecipient = :bob.crt\n"), smime_error);
	BOOST_CHECK_THROW(parse("[encrypting]\nrecipient = bob@example.com:a.crt\nrecipient = BOB@example.com:b.crt\n"), smime_error);
	BOOST_CHECK_THROW(parse("[encrypting]\nrecipient = bob@example.com:a.crt\nrecipient = bob@example.com:a.crt\n"), smime_error);
	BOOST_CHECK_THROW(parse("[encrypting]\nrecipient = bob@example.com:a.crt\nrecipient = bob@example.com : b.crt\n"), smime_error);
	// repeated single valued option
	BOOST_CHECK_THROW(parse("[signing]\ncert = a.crt\ncert = b.crt\n"), smime_error);
	// syntax error
	BOOST_CHECK_THROW(parse("[signing\ncert = a.crt\n"), smime_error);
}

BOOST_AUTO_TEST_CASE(load_config_test)
{
	auto & pki = get_test_pki();
	auto path = pki.dir / "mailer.ini";

	write_file(path,
		"[signing]\n"
		"cert = " + pki.sender.cert_path.string() + "\n"
		"key = " + pki.sender.key_path.string() + "\n"
		"[encrypting]\n"
		"cert = " + pki.alice.cert_path.string() + "\n");

	auto config = load_config(path.string());
	BOOST_REQUIRE(config.signing_cert);
	BOOST_CHECK_EQUAL(config.signing_cert->value, pki.sender.cert_path.string());
	BOOST_CHECK(not config.signing_key_passphrase);
	BOOST_CHECK_EQUAL(ext::smime::size(config.encrypting_certs), 1u);

	BOOST_CHECK_THROW(load_config((pki.dir / "missing.ini").string()), smime_error);
}

BOOST_AUTO_TEST_SUITE_END()
