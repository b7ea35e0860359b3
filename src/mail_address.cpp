#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <ext/smime/mail/address.hpp>

namespace ext::smime::mail
{
	/// ищет заданный символ, учитывая возможность закавычивания
	template <class Iterator>
	static Iterator find_nonquoted(Iterator first, Iterator last, char ch)
	{
		bool quoted = false;
		int  comment_level = 0;
		for (; first != last; ++first)
		{
			auto cur = *first;

			if (cur == '\\')
			{
				// skipping next char
				if (++first == last) return first;
				continue;
			}

			if (cur == '"')
			{
				quoted = not quoted;
				continue;
			}

			if (quoted) continue;

			if (cur == '(')
			{
				++comment_level;
				continue;
			}

			if (cur == ')')
			{
				--comment_level;
				continue;
			}

			if (cur == ch && comment_level == 0) return first;
		}

		return first;
	}

	std::string_view extract_addr(std::string_view str)
	{
		auto * first = str.data();
		auto * last =  first + str.size();
		std::string_view result = str;

		// мы хотим найти angle braced адрес. Если таких несколько - нас интересует последний.
		// т.е. в Name <somestr> <addr> мы хотим addr
		for (;;)
		{
			auto open = find_nonquoted(first, last, '<');
			if (open == last) break;

			auto close = find_nonquoted(++open, last, '>');
			if (close == last) break;

			result = std::string_view(open, close - open);
			first = ++close;
		}

		return result;
	}

	std::string normalize_addr(std::string_view str)
	{
		std::string addr(extract_addr(str));
		boost::algorithm::trim(addr);
		boost::algorithm::to_lower(addr);
		return addr;
	}
}
