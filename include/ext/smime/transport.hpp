#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <ext/smime/signer.hpp>

namespace ext::smime
{
	/// Mail transport: delivers sealed messages.
	/// Rejected recipients are reported, not thrown
	class mail_transport
	{
	public:
		virtual ~mail_transport() = default;

		/// sends message, returns number of recipients which accepted message,
		/// rejected recipients are appended to failed_recipients
		virtual std::size_t send(const sealed_message & msg, std::vector<std::string> & failed_recipients) = 0;
	};

	/// writes sealed messages into std::ostream one after another.
	/// Every recipient is accepted while stream is good, all are rejected otherwise
	class stream_transport : public mail_transport
	{
	private:
		std::ostream * m_os = nullptr;

	public:
		std::size_t send(const sealed_message & msg, std::vector<std::string> & failed_recipients) override;

	public:
		stream_transport(std::ostream & os) : m_os(&os) {}
	};
}
