#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ext/smime/openssl.hpp>

namespace ext::smime
{
	/// PEM encoded certificate or private key, given either by file path or by content
	struct pem_source
	{
		enum source_kind : unsigned
		{
			file,   // value is a path to PEM file
			memory, // value is PEM content itself
		};

		source_kind kind = file;
		std::string value;

	public:
		static pem_source from_file(std::string path)  { return {file, std::move(path)}; }
		static pem_source from_memory(std::string pem) { return {memory, std::move(pem)}; }
	};

	inline bool operator ==(const pem_source & lhs, const pem_source & rhs) noexcept { return lhs.kind == rhs.kind and lhs.value == rhs.value; }
	inline bool operator !=(const pem_source & lhs, const pem_source & rhs) noexcept { return not (lhs == rhs); }

	/// short human readable description for logging: path for files, "<memory pem, N bytes>" otherwise
	std::string to_string(const pem_source & source);

	/// Loads certificate/private key from source. Files are opened and closed within the call.
	/// Throws std::system_error in case of errors
	openssl::x509_iptr     load_certificate(const pem_source & source);
	openssl::evp_pkey_iptr load_private_key(const pem_source & source, std::string_view passphrase);


	/// sender certificate and private key
	struct signing_identity
	{
		std::optional<pem_source> certificate;
		std::optional<pem_source> private_key;
		std::string passphrase; // empty if private key is not encrypted

	public:
		bool empty() const noexcept { return not certificate and not private_key; }
	};


	/// one certificate for all recipients
	struct single_certificate
	{
		pem_source certificate;
	};

	/// every message copy is encrypted for all those certificates
	struct certificate_list
	{
		std::vector<pem_source> certificates;
	};

	/// each recipient gets own copy encrypted with it's certificate.
	/// keys are normalized addresses, see mail::normalize_addr
	struct certificates_by_recipient
	{
		std::map<std::string, pem_source> certificates;
	};

	/// recipient encryption certificates, std::monostate - no encryption
	using encryption_certificates = std::variant<std::monostate, single_certificate, certificate_list, certificates_by_recipient>;

	/// makes encryption_certificates from list: none for empty list, single_certificate for one element, certificate_list otherwise
	encryption_certificates make_encryption_certificates(std::vector<pem_source> certs);
	/// makes certificates_by_recipient from address -> certificate map, none for empty map.
	/// Addresses are normalized, throws smime_error if two addresses normalize to same one
	encryption_certificates make_encryption_certificates(const std::map<std::string, pem_source> & certs);

	/// true if no encryption certificates are configured
	bool empty(const encryption_certificates & certs) noexcept;
	/// number of configured certificates
	std::size_t size(const encryption_certificates & certs) noexcept;
	/// short description for logging
	std::string to_string(const encryption_certificates & certs);
}
