#pragma once
#include <string>
#include <string_view>

namespace ext::smime::mail
{
	/// вспомогательный метод для извлечения email адреса из строки вида:
	/// User Name <email.addr@domaim>
	/// <email.addr@domaim>
	///
	/// если строка вида email.addr@domaim, она будет возвращена как есть
	std::string_view extract_addr(std::string_view str);

	/// extracts address with extract_addr, trims spaces and lowercases it.
	/// Used as key for recipient address lookups
	std::string normalize_addr(std::string_view str);
}
