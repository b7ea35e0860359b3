// smime-seal: seals a message with configured S/MIME identity and writes it to stdout
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>
#include <memory>
#include <vector>

#include <boost/program_options.hpp>

#include <ext/log/logger.hpp>

#include <ext/smime/config.hpp>
#include <ext/smime/mailer.hpp>
#include <ext/smime/openssl.hpp>
#include <ext/smime/transport.hpp>

static std::string read_all(std::istream & is)
{
	return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

static std::string read_file(const std::string & path)
{
	std::ifstream ifs(path, std::ios::binary);
	if (not ifs) throw std::runtime_error("failed to open " + path);

	return read_all(ifs);
}

int main(int argc, char * argv[])
{
	namespace po = boost::program_options;

	po::options_description opts("options");
	po::variables_map vm;

	std::string config_path, body_file, log_level;
	std::vector<std::string> attachments;
	ext::smime::mail::message msg;

	opts.add_options()
		("help,h", "print this help")
		("config,c", po::value(&config_path)->required(), "configuration file path")
		("from,f", po::value(&msg.from)->required(), "sender address")
		("to,t", po::value(&msg.recipients)->composing(), "recipient address")
		("cc", po::value(&msg.cc_recipients)->composing(), "carbon copy recipient address")
		("bcc", po::value(&msg.bcc_recipients)->composing(), "blind carbon copy recipient address")
		("subject,s", po::value(&msg.subject), "message subject")
		("content-type", po::value(&msg.content_type), "body content type, text/plain by default")
		("body-file,b", po::value(&body_file), "message body file, stdin if not given")
		("attach,a", po::value(&attachments)->composing(), "attachment file path")
		("log-level,l", po::value(&log_level), "log level, logging is disabled by default");

	try
	{
		store(po::parse_command_line(argc, argv, opts), vm);
		if (vm.count("help"))
		{
			std::cout << opts << std::endl;
			return EXIT_SUCCESS;
		}

		notify(vm);
	}
	catch (po::error & ex)
	{
		std::cerr << ex.what() << std::endl;
		std::cerr << opts << std::endl;
		return EXIT_FAILURE;
	}

	std::unique_ptr<ext::log::logger> logger;
	if (not log_level.empty())
		logger = std::make_unique<ext::log::ostream_logger>(std::cerr, ext::log::parse_log_level(log_level));

	ext::smime::openssl_init();

	try
	{
		msg.body = body_file.empty() ? read_all(std::cin) : read_file(body_file);
		for (auto & path : attachments)
		{
			ext::smime::mail::mail_attachment attachment;
			attachment.name = std::filesystem::path(path).filename().string();
			attachment.content = read_file(path);
			msg.attachments.push_back(std::move(attachment));
		}

		auto config = ext::smime::load_config(config_path);

		ext::smime::stream_transport transport(std::cout);
		ext::smime::smime_mailer mailer(transport, config, logger.get());

		bool sent = mailer.send(msg);
		for (auto & addr : msg.failed_recipients)
			std::cerr << "rejected: " << addr << std::endl;

		ext::smime::openssl_cleanup();
		return sent ? EXIT_SUCCESS : EXIT_FAILURE;
	}
	catch (std::exception & ex)
	{
		std::cerr << ex.what() << std::endl;
		ext::smime::openssl::print_error_queue(std::cerr);

		ext::smime::openssl_cleanup();
		return EXIT_FAILURE;
	}
}
