#define BOOST_TEST_MODULE "smimelib tests"
#include <cstdlib>
#include <iostream>
#include <boost/program_options.hpp>
#include <boost/test/unit_test.hpp>

#include <ext/log/logger.hpp>
#include <ext/smime/openssl.hpp>

#include "test_pki.hpp"

unsigned LogLevel = ext::log::Disabled;

static void parse_command_opts(int argc, char *argv[])
{
	boost::program_options::options_description opts("options");
	boost::program_options::variables_map vm;

	std::string log_level;

	opts.add_options()
		("log-level,l", boost::program_options::value(&log_level));

	try
	{
		store(boost::program_options::command_line_parser(argc, argv).options(opts).allow_unregistered().run(), vm);
		notify(vm);
	}
	catch (boost::program_options::error & ex)
	{
		std::cerr << ex.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (not log_level.empty())
		LogLevel = ext::log::parse_log_level(log_level);
}

struct GlobalFixture
{
	GlobalFixture()
	{
		ext::smime::openssl_init();

		auto argc = boost::unit_test::framework::master_test_suite().argc;
		auto argv = boost::unit_test::framework::master_test_suite().argv;

		parse_command_opts(argc, argv);
		create_test_pki();
	}

	~GlobalFixture()
	{
		remove_test_pki();
		ext::smime::openssl_cleanup();
	}
};

BOOST_GLOBAL_FIXTURE(GlobalFixture);
