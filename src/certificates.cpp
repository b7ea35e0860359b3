#include <ext/smime/certificates.hpp>
#include <ext/smime/errors.hpp>
#include <ext/smime/mail/address.hpp>

namespace ext::smime
{
	std::string to_string(const pem_source & source)
	{
		if (source.kind == pem_source::file)
			return source.value;

		return "<memory pem, " + std::to_string(source.value.size()) + " bytes>";
	}

	openssl::x509_iptr load_certificate(const pem_source & source)
	{
		if (source.kind == pem_source::file)
			return openssl::load_certificate_from_file(source.value);
		else
			return openssl::load_certificate(source.value);
	}

	openssl::evp_pkey_iptr load_private_key(const pem_source & source, std::string_view passphrase)
	{
		if (source.kind == pem_source::file)
			return openssl::load_private_key_from_file(source.value, passphrase);
		else
			return openssl::load_private_key(source.value, passphrase);
	}

	encryption_certificates make_encryption_certificates(std::vector<pem_source> certs)
	{
		switch (certs.size())
		{
			case 0:  return std::monostate();
			case 1:  return single_certificate {std::move(certs.front())};
			default: return certificate_list {std::move(certs)};
		}
	}

	encryption_certificates make_encryption_certificates(const std::map<std::string, pem_source> & certs)
	{
		if (certs.empty()) return std::monostate();

		certificates_by_recipient result;
		for (auto & [addr, cert] : certs)
		{
			auto normalized = mail::normalize_addr(addr);
			if (normalized.empty())
				throw smime_error("ext::smime::make_encryption_certificates: empty recipient address for certificate " + to_string(cert));

			auto [it, inserted] = result.certificates.emplace(std::move(normalized), cert);
			if (not inserted)
				throw smime_error("ext::smime::make_encryption_certificates: duplicate recipient address " + it->first);
		}

		return result;
	}

	namespace
	{
		struct size_visitor
		{
			std::size_t operator()(std::monostate) const noexcept { return 0; }
			std::size_t operator()(const single_certificate &) const noexcept { return 1; }
			std::size_t operator()(const certificate_list & list) const noexcept { return list.certificates.size(); }
			std::size_t operator()(const certificates_by_recipient & map) const noexcept { return map.certificates.size(); }
		};

		struct to_string_visitor
		{
			std::string operator()(std::monostate) const { return "none"; }
			std::string operator()(const single_certificate & single) const { return "single(" + to_string(single.certificate) + ")"; }

			std::string operator()(const certificate_list & list) const
			{
				std::string result = "list(";
				for (auto & cert : list.certificates)
				{
					if (&cert != &list.certificates.front()) result += ", ";
					result += to_string(cert);
				}

				return result += ")";
			}

			std::string operator()(const certificates_by_recipient & map) const
			{
				std::string result = "by_recipient(";
				bool first = true;
				for (auto & [addr, cert] : map.certificates)
				{
					if (not first) result += ", ";
					result += addr;
					result += ": ";
					result += to_string(cert);
					first = false;
				}

				return result += ")";
			}
		};
	}

	bool empty(const encryption_certificates & certs) noexcept
	{
		return size(certs) == 0;
	}

	std::size_t size(const encryption_certificates & certs) noexcept
	{
		return std::visit(size_visitor(), certs);
	}

	std::string to_string(const encryption_certificates & certs)
	{
		return std::visit(to_string_visitor(), certs);
	}
}
