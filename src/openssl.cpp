#include <cassert>
#include <cerrno>
#include <cstdio>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <ext/smime/openssl.hpp>


int  intrusive_ptr_add_ref(X509 * ptr) { return ::X509_up_ref(ptr); }
void intrusive_ptr_release(X509 * ptr) { return ::X509_free(ptr);   }

int  intrusive_ptr_add_ref(EVP_PKEY * ptr) { return ::EVP_PKEY_up_ref(ptr); }
void intrusive_ptr_release(EVP_PKEY * ptr) { return ::EVP_PKEY_free(ptr);   }


namespace ext::smime::openssl
{
	/************************************************************************/
	/*                      errors                                          */
	/************************************************************************/
	namespace
	{
		class openssl_error_category : public std::error_category
		{
		public:
			const char * name() const noexcept override { return "openssl_err"; }

			std::string message(int code) const override
			{
				// ERR_error_string_n requires at least 120 bytes, result is always null terminated
				char buffer[256];
				::ERR_error_string_n(static_cast<unsigned long>(code), buffer, sizeof(buffer));
				return buffer;
			}
		};

		openssl_error_category category_instance;

		int append_to_string(const char * data, std::size_t len, void * ptr)
		{
			static_cast<std::string *>(ptr)->append(data, len);
			return 1;
		}

		int write_to_ostream(const char * data, std::size_t len, void * ptr)
		{
			auto & os = *static_cast<std::ostream *>(ptr);
			os.write(data, static_cast<std::streamsize>(len));
			return os ? 1 : 0;
		}
	}

	const std::error_category & openssl_err_category() noexcept
	{
		return category_instance;
	}

	void openssl_clear_errors() noexcept
	{
		::ERR_clear_error();
	}

	std::error_code last_error(error_retrieve rtype) noexcept
	{
		unsigned long code = rtype == error_retrieve::peek ? ::ERR_peek_error() : ::ERR_get_error();
		return {static_cast<int>(code), category_instance};
	}

	void throw_last_error(const std::string & errmsg, error_retrieve rtype)
	{
		throw std::system_error(last_error(rtype), errmsg);
	}

	void print_error_queue(std::string & str)
	{
		::ERR_print_errors_cb(append_to_string, &str);
	}

	void print_error_queue(std::ostream & os)
	{
		::ERR_print_errors_cb(write_to_ostream, &os);
	}

	std::string print_error_queue()
	{
		std::string result;
		print_error_queue(result);
		return result;
	}

	/************************************************************************/
	/*                  init/cleanup                                        */
	/************************************************************************/
	void openssl_init()
	{
		::OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CRYPTO_STRINGS | OPENSSL_INIT_ADD_ALL_CIPHERS | OPENSSL_INIT_ADD_ALL_DIGESTS, nullptr);
	}

	void openssl_cleanup()
	{
		// openssl >= 1.1.0 releases global state at exit by itself
		::ERR_clear_error();
	}

	/************************************************************************/
	/*                  smart pointers                                      */
	/************************************************************************/
	void bio_deleter::operator()(BIO * bio) const noexcept           { ::BIO_vfree(bio); }
	void x509_deleter::operator()(X509 * cert) const noexcept        { ::X509_free(cert); }
	void evp_pkey_deleter::operator()(EVP_PKEY * pkey) const noexcept { ::EVP_PKEY_free(pkey); }

	void stackof_x509_deleter::operator()(STACK_OF(X509) * stack) const noexcept
	{
		// sk_X509_free would leak certificates
		::sk_X509_pop_free(stack, ::X509_free);
	}

	/************************************************************************/
	/*                  PEM loading                                         */
	/************************************************************************/
	namespace
	{
		struct file_closer { void operator()(std::FILE * fp) const noexcept { std::fclose(fp); } };
		using file_uptr = std::unique_ptr<std::FILE, file_closer>;

		int password_callback(char * buff, int bufsize, int /*rwflag*/, void * userdata)
		{
			auto & passwd = *static_cast<std::string_view *>(userdata);
			return static_cast<int>(passwd.copy(buff, static_cast<std::size_t>(bufsize)));
		}

		file_uptr open_pem_file(const char * path, const char * caller)
		{
			file_uptr fp(std::fopen(path, "r"));
			if (not fp)
			{
				std::error_code errc(errno, std::generic_category());
				throw std::system_error(errc, std::string(caller) + ": failed to open " + path);
			}

			return fp;
		}

		bio_uptr make_mem_bio(const char * data, std::size_t len, const char * caller)
		{
			bio_uptr bio(::BIO_new_mem_buf(data, static_cast<int>(len)));
			if (not bio) throw_last_error(std::string(caller) + ": ::BIO_new_mem_buf failed");
			return bio;
		}
	}

	stackof_x509_uptr make_x509_stack()
	{
		stackof_x509_uptr stack(sk_X509_new_null());
		if (not stack) throw_last_error("ext::smime::openssl::make_x509_stack: ::sk_X509_new_null failed");
		return stack;
	}

	void push_certificate(stack_st_X509 * stack, X509 * cert)
	{
		assert(stack and cert);
		if (::X509_up_ref(cert) != 1)
			throw_last_error("ext::smime::openssl::push_certificate: ::X509_up_ref failed");

		if (sk_X509_push(stack, cert) <= 0)
		{
			::X509_free(cert);
			throw_last_error("ext::smime::openssl::push_certificate: ::sk_X509_push failed");
		}
	}

	x509_iptr load_certificate(const char * data, std::size_t len, std::string_view passwd)
	{
		auto bio = make_mem_bio(data, len, "ext::smime::openssl::load_certificate");

		x509_iptr cert(::PEM_read_bio_X509(bio.get(), nullptr, password_callback, &passwd), ext::noaddref);
		if (not cert) throw_last_error("ext::smime::openssl::load_certificate: ::PEM_read_bio_X509 failed");
		return cert;
	}

	evp_pkey_iptr load_private_key(const char * data, std::size_t len, std::string_view passwd)
	{
		auto bio = make_mem_bio(data, len, "ext::smime::openssl::load_private_key");

		// both traditional and PKCS#8 keys are accepted
		evp_pkey_iptr pkey(::PEM_read_bio_PrivateKey(bio.get(), nullptr, password_callback, &passwd), ext::noaddref);
		if (not pkey) throw_last_error("ext::smime::openssl::load_private_key: ::PEM_read_bio_PrivateKey failed");
		return pkey;
	}

	x509_iptr load_certificate_from_file(const char * path, std::string_view passwd)
	{
		auto fp = open_pem_file(path, "ext::smime::openssl::load_certificate_from_file");

		x509_iptr cert(::PEM_read_X509(fp.get(), nullptr, password_callback, &passwd), ext::noaddref);
		if (not cert) throw_last_error("ext::smime::openssl::load_certificate_from_file: ::PEM_read_X509 failed for " + std::string(path));
		return cert;
	}

	evp_pkey_iptr load_private_key_from_file(const char * path, std::string_view passwd)
	{
		auto fp = open_pem_file(path, "ext::smime::openssl::load_private_key_from_file");

		evp_pkey_iptr pkey(::PEM_read_PrivateKey(fp.get(), nullptr, password_callback, &passwd), ext::noaddref);
		if (not pkey) throw_last_error("ext::smime::openssl::load_private_key_from_file: ::PEM_read_PrivateKey failed for " + std::string(path));
		return pkey;
	}

	/************************************************************************/
	/*                  misc                                                */
	/************************************************************************/
	bool check_private_key(X509 * cert, EVP_PKEY * pkey) noexcept
	{
		return ::X509_check_private_key(cert, pkey) == 1;
	}

	std::string subject_name(X509 * cert)
	{
		if (not cert) return {};

		bio_uptr bio(::BIO_new(::BIO_s_mem()));
		if (not bio) throw_last_error("ext::smime::openssl::subject_name: ::BIO_new failed");

		if (::X509_NAME_print_ex(bio.get(), ::X509_get_subject_name(cert), 0, XN_FLAG_ONELINE) < 0)
			throw_last_error("ext::smime::openssl::subject_name: ::X509_NAME_print_ex failed");

		return read_mem_bio(bio.get());
	}

	const EVP_CIPHER * cipher_by_name(const std::string & name)
	{
		const EVP_CIPHER * cipher = ::EVP_get_cipherbyname(name.c_str());
		if (not cipher)
		{
			std::error_code errc(EINVAL, std::generic_category());
			throw std::system_error(errc, "ext::smime::openssl::cipher_by_name: unknown cipher " + name);
		}

		return cipher;
	}

	std::string read_mem_bio(BIO * bio)
	{
		char * data = nullptr;
		long len = BIO_get_mem_data(bio, &data);
		if (len <= 0) return {};

		return std::string(data, static_cast<std::size_t>(len));
	}
}
