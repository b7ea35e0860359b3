#pragma once
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <ext/intrusive_ptr.hpp>

// openssl types used in declarations, no need to pull openssl headers here
struct bio_st;
struct x509_st;
struct evp_pkey_st;
struct evp_cipher_st;
struct stack_st_X509;

typedef bio_st           BIO;
typedef x509_st          X509;
typedef evp_pkey_st      EVP_PKEY;
typedef evp_cipher_st    EVP_CIPHER;

// ext::intrusive_ptr support, X509_up_ref/X509_free and EVP_PKEY_up_ref/EVP_PKEY_free
int  intrusive_ptr_add_ref(X509 * ptr);
void intrusive_ptr_release(X509 * ptr);
int  intrusive_ptr_add_ref(EVP_PKEY * ptr);
void intrusive_ptr_release(EVP_PKEY * ptr);


/// OpenSSL utilities used by smime sealing:
/// error category, error queue printing, smart pointers, PEM loading
namespace ext::smime::openssl
{
	/// How an error is taken from thread local openssl error queue.
	/// Queue can hold several errors for a single failure while std::error_code holds only one.
	/// get removes taken error from queue, so print_error_queue will not print it,
	/// peek leaves it there, queue should be cleared with openssl_clear_errors later
	enum class error_retrieve : unsigned
	{
		get,  // ::ERR_get_error
		peek, // ::ERR_peek_error
	};

	/// std::error_category for ERR_* codes
	const std::error_category & openssl_err_category() noexcept;

	/// empties error queue of calling thread
	void openssl_clear_errors() noexcept;

	/// takes error from queue and wraps it into std::error_code with openssl_err_category
	std::error_code last_error(error_retrieve rtype = error_retrieve::get) noexcept;
	/// throws std::system_error with last_error(rtype) and given message
	[[noreturn]] void throw_last_error(const std::string & errmsg, error_retrieve rtype = error_retrieve::get);

	/// Prints whole error queue with all additional data, like ::ERR_print_errors.
	/// Queue is empty afterwards
	void print_error_queue(std::string & str);
	void print_error_queue(std::ostream & os);
	std::string print_error_queue();

	void openssl_init();
	void openssl_cleanup();


	struct bio_deleter      { void operator()(BIO * bio)       const noexcept; };
	struct x509_deleter     { void operator()(X509 * cert)     const noexcept; };
	struct evp_pkey_deleter { void operator()(EVP_PKEY * pkey) const noexcept; };
	/// frees stack together with certificates in it
	struct stackof_x509_deleter { void operator()(stack_st_X509 * stack) const noexcept; };

	using bio_uptr          = std::unique_ptr<BIO, bio_deleter>;
	using x509_uptr         = std::unique_ptr<X509, x509_deleter>;
	using evp_pkey_uptr     = std::unique_ptr<EVP_PKEY, evp_pkey_deleter>;
	using stackof_x509_uptr = std::unique_ptr<stack_st_X509, stackof_x509_deleter>;

	/// certificates and keys are shared between signer and openssl stacks, so they are refcounted
	using x509_iptr     = ext::intrusive_ptr<X509>;
	using evp_pkey_iptr = ext::intrusive_ptr<EVP_PKEY>;


	/// creates empty STACK_OF(X509), throws std::system_error on failure
	stackof_x509_uptr make_x509_stack();
	/// pushes certificate into stack, stack takes own reference.
	/// Throws std::system_error on failure
	void push_certificate(stack_st_X509 * stack, X509 * cert);

	/// PEM loaders. passwd is used for encrypted private keys, empty passwd means key is not encrypted.
	/// Parse errors and bad passwords are thrown as std::system_error with openssl_err_category,
	/// file open errors - as std::system_error with std::generic_category
	x509_iptr     load_certificate(const char * data, std::size_t len, std::string_view passwd = "");
	evp_pkey_iptr load_private_key(const char * data, std::size_t len, std::string_view passwd = "");

	inline x509_iptr     load_certificate(std::string_view pem, std::string_view passwd = "") { return load_certificate(pem.data(), pem.size(), passwd); }
	inline evp_pkey_iptr load_private_key(std::string_view pem, std::string_view passwd = "") { return load_private_key(pem.data(), pem.size(), passwd); }

	x509_iptr     load_certificate_from_file(const char * path, std::string_view passwd = "");
	evp_pkey_iptr load_private_key_from_file(const char * path, std::string_view passwd = "");

	inline x509_iptr     load_certificate_from_file(const std::string & path, std::string_view passwd = "") { return load_certificate_from_file(path.c_str(), passwd); }
	inline evp_pkey_iptr load_private_key_from_file(const std::string & path, std::string_view passwd = "") { return load_private_key_from_file(path.c_str(), passwd); }

	/// true if private key matches public key of certificate, see ::X509_check_private_key
	bool check_private_key(X509 * cert, EVP_PKEY * pkey) noexcept;

	/// one line subject name of certificate, empty string for null
	std::string subject_name(X509 * cert);

	/// cipher by openssl name, like "aes-256-cbc".
	/// Throws std::system_error(EINVAL) for unknown names
	const EVP_CIPHER * cipher_by_name(const std::string & name);

	/// whole content of memory BIO
	std::string read_mem_bio(BIO * bio);
}

namespace ext::smime
{
	using openssl::openssl_err_category;
	using openssl::openssl_init;
	using openssl::openssl_cleanup;
}
