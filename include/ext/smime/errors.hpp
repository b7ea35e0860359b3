#pragma once
#include <stdexcept>
#include <string>

namespace ext::smime
{
	/// configuration or sealing error not coming from openssl error queue,
	/// openssl errors are reported with std::system_error, see ext/smime/openssl.hpp
	class smime_error : public std::runtime_error
	{
	public:
		smime_error(const std::string & err_msg) :
			std::runtime_error(err_msg) {}
	};
}
