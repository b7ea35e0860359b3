#include <ext/smime/transport.hpp>

namespace ext::smime
{
	std::size_t stream_transport::send(const sealed_message & msg, std::vector<std::string> & failed_recipients)
	{
		m_os->write(msg.data.data(), static_cast<std::streamsize>(msg.data.size()));
		m_os->flush();

		if (*m_os)
			return msg.recipients.size();

		failed_recipients.insert(failed_recipients.end(), msg.recipients.begin(), msg.recipients.end());
		return 0;
	}
}
