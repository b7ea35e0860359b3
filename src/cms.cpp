#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <vector>

#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <ext/smime/cms.hpp>
#include <ext/smime/errors.hpp>

namespace ext::smime::cms
{
	namespace
	{
		struct cms_contentinfo_deleter { void operator()(CMS_ContentInfo * info) const noexcept { CMS_ContentInfo_free(info); } };
		using cms_contentinfo_ptr = std::unique_ptr<CMS_ContentInfo, cms_contentinfo_deleter>;

		struct flag_name
		{
			const char * name;
			unsigned value;
		};

		// CMS_NOVERIFY is an alias of CMS_NO_SIGNER_CERT_VERIFY and CMS_NOSIGS is a combination - both only for parsing
		const flag_name flag_names[] =
		{
			{"CMS_TEXT",                  CMS_TEXT},
			{"CMS_NOCERTS",               CMS_NOCERTS},
			{"CMS_NO_CONTENT_VERIFY",     CMS_NO_CONTENT_VERIFY},
			{"CMS_NO_ATTR_VERIFY",        CMS_NO_ATTR_VERIFY},
			{"CMS_NOINTERN",              CMS_NOINTERN},
			{"CMS_NO_SIGNER_CERT_VERIFY", CMS_NO_SIGNER_CERT_VERIFY},
			{"CMS_DETACHED",              CMS_DETACHED},
			{"CMS_BINARY",                CMS_BINARY},
			{"CMS_NOATTR",                CMS_NOATTR},
			{"CMS_NOSMIMECAP",            CMS_NOSMIMECAP},
			{"CMS_NOOLDMIMETYPE",         CMS_NOOLDMIMETYPE},
			{"CMS_CRLFEOL",               CMS_CRLFEOL},
			{"CMS_STREAM",                CMS_STREAM},
			{"CMS_NOCRL",                 CMS_NOCRL},
			{"CMS_PARTIAL",               CMS_PARTIAL},
			{"CMS_REUSE_DIGEST",          CMS_REUSE_DIGEST},
			{"CMS_USE_KEYID",             CMS_USE_KEYID},
			{"CMS_DEBUG_DECRYPT",         CMS_DEBUG_DECRYPT},
			{"CMS_KEY_PARAM",             CMS_KEY_PARAM},
			{"CMS_ASCIICRLF",             CMS_ASCIICRLF},
			{"CMS_NOVERIFY",              CMS_NOVERIFY},
			{"CMS_NOSIGS",                CMS_NOSIGS},
		};

		// last two entries are aliases and are not printed
		constexpr std::size_t printable_flag_count = std::size(flag_names) - 2;
	}

	static bool parse_number(const std::string & str, unsigned & result)
	{
		if (str.empty() or not std::isdigit(static_cast<unsigned char>(str.front())))
			return false;

		char * stopped;
		errno = 0;
		unsigned long val = std::strtoul(str.c_str(), &stopped, 0);
		if (errno != 0 or *stopped != 0) return false;

		result = static_cast<unsigned>(val);
		return true;
	}

	unsigned parse_flags(std::string_view str)
	{
		std::vector<std::string> parts;
		boost::algorithm::split(parts, str, [](char ch) { return ch == '|'; });

		unsigned flags = 0;
		for (auto & part : parts)
		{
			boost::algorithm::trim(part);
			if (part.empty()) continue;

			unsigned number;
			if (parse_number(part, number))
			{
				flags |= number;
				continue;
			}

			auto first = std::begin(flag_names);
			auto last  = std::end(flag_names);
			auto it = std::find_if(first, last, [&part](auto & fn) { return part == fn.name; });
			if (it == last)
				throw smime_error("ext::smime::cms::parse_flags: unknown CMS flag \"" + part + "\"");

			flags |= it->value;
		}

		return flags;
	}

	std::string format_flags(unsigned flags)
	{
		std::string result;
		for (std::size_t idx = 0; idx < printable_flag_count; ++idx)
		{
			auto & fn = flag_names[idx];
			if ((flags & fn.value) == 0) continue;

			if (not result.empty()) result += " | ";
			result += fn.name;
			flags &= ~fn.value;
		}

		if (flags)
		{
			char buffer[16];
			std::snprintf(buffer, sizeof(buffer), "0x%x", flags);

			if (not result.empty()) result += " | ";
			result += buffer;
		}

		return result;
	}

	std::string sign_entity(EVP_PKEY * pkey, X509 * x509, stack_st_X509 * additional_certs, const EVP_MD * md,
	                        std::string_view entity, unsigned flags)
	{
		using namespace ext::smime::openssl;

		bio_uptr bio_input_ptr, bio_output_ptr;
		bio_input_ptr.reset( ::BIO_new_mem_buf(entity.data(), static_cast<int>(entity.size())) );
		bio_output_ptr.reset( ::BIO_new(::BIO_s_mem()) );

		if (not bio_input_ptr)  throw_last_error("ext::smime::cms::sign_entity: input  BIO_mem fail(::BIO_new_mem_buf)");
		if (not bio_output_ptr) throw_last_error("ext::smime::cms::sign_entity: output BIO_mem fail(::BIO_new(::BIO_s_mem()))");

		// signing is performed while writing S/MIME output,
		// signer is added separately so digest can be chosen
		flags |= CMS_STREAM | CMS_CRLFEOL;

		cms_contentinfo_ptr cms_info(::CMS_sign(nullptr, nullptr, additional_certs, bio_input_ptr.get(), flags | CMS_PARTIAL));
		if (not cms_info) throw_last_error("ext::smime::cms::sign_entity: CMS_sign call failure");

		if (not ::CMS_add1_signer(cms_info.get(), x509, pkey, md, flags))
			throw_last_error("ext::smime::cms::sign_entity: CMS_add1_signer call failure");

		int res = ::SMIME_write_CMS(bio_output_ptr.get(), cms_info.get(), bio_input_ptr.get(), static_cast<int>(flags));
		if (res <= 0) throw_last_error("ext::smime::cms::sign_entity: SMIME_write_CMS call failure");

		return read_mem_bio(bio_output_ptr.get());
	}

	std::string encrypt_entity(stack_st_X509 * recipients, const EVP_CIPHER * cipher, std::string_view entity, unsigned flags)
	{
		using namespace ext::smime::openssl;

		bio_uptr bio_input_ptr, bio_output_ptr;
		bio_input_ptr.reset( ::BIO_new_mem_buf(entity.data(), static_cast<int>(entity.size())) );
		bio_output_ptr.reset( ::BIO_new(::BIO_s_mem()) );

		if (not bio_input_ptr)  throw_last_error("ext::smime::cms::encrypt_entity: input  BIO_mem fail(::BIO_new_mem_buf)");
		if (not bio_output_ptr) throw_last_error("ext::smime::cms::encrypt_entity: output BIO_mem fail(::BIO_new(::BIO_s_mem()))");

		// encryption is performed while writing S/MIME output
		flags |= CMS_STREAM | CMS_CRLFEOL;

		cms_contentinfo_ptr cms_info(::CMS_encrypt(recipients, bio_input_ptr.get(), cipher, flags));
		if (not cms_info) throw_last_error("ext::smime::cms::encrypt_entity: CMS_encrypt call failure");

		int res = ::SMIME_write_CMS(bio_output_ptr.get(), cms_info.get(), bio_input_ptr.get(), static_cast<int>(flags));
		if (res <= 0) throw_last_error("ext::smime::cms::encrypt_entity: SMIME_write_CMS call failure");

		return read_mem_bio(bio_output_ptr.get());
	}
}
