#include <cstring>
#include <fstream>
#include <map>
#include <vector>

#include <boost/program_options.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <ext/smime/config.hpp>
#include <ext/smime/errors.hpp>

namespace ext::smime
{
	static std::map<std::string, pem_source> parse_recipient_certs(const std::vector<std::string> & entries)
	{
		std::map<std::string, pem_source> result;
		for (auto & entry : entries)
		{
			auto pos = entry.find(':');
			if (pos == entry.npos)
				throw smime_error("ext::smime::parse_config: bad encrypting.recipient value \"" + entry + "\", expected address:path");

			auto addr = boost::algorithm::trim_copy(entry.substr(0, pos));
			auto path = boost::algorithm::trim_copy(entry.substr(pos + 1));
			if (addr.empty() or path.empty())
				throw smime_error("ext::smime::parse_config: bad encrypting.recipient value \"" + entry + "\", expected address:path");

			auto inserted = result.emplace(std::move(addr), pem_source::from_file(std::move(path))).second;
			if (not inserted)
				throw smime_error("ext::smime::parse_config: duplicate encrypting.recipient value \"" + entry + "\"");
		}

		return result;
	}

	mailer_config parse_config(std::istream & is)
	{
		namespace po = boost::program_options;

		po::options_description opts("smime mailer configuration");
		po::variables_map vm;

		std::string signing_cert, signing_key, signing_passphrase;
		std::vector<std::string> encrypting_certs, recipient_certs;

		opts.add_options()
			("signing.cert", po::value(&signing_cert), "sender certificate path")
			("signing.key", po::value(&signing_key), "sender private key path")
			("signing.passphrase", po::value(&signing_passphrase), "sender private key passphrase")
			("encrypting.cert", po::value(&encrypting_certs)->composing(), "recipient certificate path")
			("encrypting.recipient", po::value(&recipient_certs)->composing(), "recipient certificate as address:path");

		mailer_config config;
		try
		{
			auto parsed = po::parse_config_file(is, opts, true);
			for (auto & opt : parsed.options)
			{
				if (not opt.unregistered) continue;

				if (not boost::algorithm::starts_with(opt.string_key, "options."))
					throw smime_error("ext::smime::parse_config: unknown option " + opt.string_key);

				auto name = opt.string_key.substr(std::strlen("options."));
				config.default_options[name] = opt.value.empty() ? std::string() : opt.value.front();
			}

			po::store(parsed, vm);
			po::notify(vm);
		}
		catch (po::error & ex)
		{
			throw smime_error(std::string("ext::smime::parse_config: ") + ex.what());
		}

		if (not encrypting_certs.empty() and not recipient_certs.empty())
			throw smime_error("ext::smime::parse_config: encrypting.cert and encrypting.recipient can not be used together");

		if (not recipient_certs.empty())
			config.encrypting_certs = make_encryption_certificates(parse_recipient_certs(recipient_certs));
		else
		{
			std::vector<pem_source> certs;
			for (auto & path : encrypting_certs)
				certs.push_back(pem_source::from_file(path));

			config.encrypting_certs = make_encryption_certificates(std::move(certs));
		}

		if (vm.count("signing.cert")) config.signing_cert = pem_source::from_file(signing_cert);
		if (vm.count("signing.key"))  config.signing_key  = pem_source::from_file(signing_key);
		if (vm.count("signing.passphrase")) config.signing_key_passphrase = signing_passphrase;

		return config;
	}

	mailer_config load_config(const std::string & path)
	{
		std::ifstream ifs(path);
		if (not ifs)
			throw smime_error("ext::smime::load_config: failed to open " + path);

		return parse_config(ifs);
	}
}
