// ==============================================================================
// indexlens/digest.hpp - Идентификаторы документов
// ==============================================================================
//
// Детерминированный ID документа: SHA-256 от имени индекса (OpenSSL EVP).
//
// ==============================================================================

#ifndef INDEXLENS_DIGEST_HPP
#define INDEXLENS_DIGEST_HPP

#include <string>
#include <string_view>

namespace indexlens {

/// SHA-256 в виде 64 hex-символов в нижнем регистре
/// @throws std::runtime_error при отказе libcrypto
std::string sha256_hex(std::string_view data);

/// ID документа для имени индекса
std::string document_id(std::string_view index_name);

}  // namespace indexlens

#endif  // INDEXLENS_DIGEST_HPP
