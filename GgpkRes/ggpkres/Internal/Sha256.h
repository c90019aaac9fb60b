#ifndef _GGPKRES_INTERNAL_SHA256_H_
#define _GGPKRES_INTERNAL_SHA256_H_

#include <array>
#include <cstdint>
#include <span>
#include <string>

#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/sha.h>

#include "../Common.h"

namespace GgpkRes::Internal {
	[[nodiscard]] inline std::array<uint8_t, 32> Sha256(std::span<const uint8_t> data) {
		std::array<uint8_t, 32> hash{};
		CryptoPP::SHA256 sha256;
		sha256.Update(data.data(), data.size());
		sha256.Final(reinterpret_cast<CryptoPP::byte*>(hash.data()));
		return hash;
	}

	[[nodiscard]] inline std::string ToHexString(std::span<const uint8_t> data) {
		CryptoPP::HexEncoder encoder;
		encoder.Put(data.data(), data.size());
		encoder.MessageEnd();

		std::string buf(static_cast<size_t>(encoder.MaxRetrievable()), 0);
		encoder.Get(reinterpret_cast<CryptoPP::byte*>(&buf[0]), buf.size());
		return buf;
	}

	/// \brief Throws CorruptDataException if the SHA-256 of data differs from expected.
	inline void VerifySha256(std::span<const uint8_t> data, const std::array<uint8_t, 32>& expected, const std::string& description) {
		if (const auto actual = Sha256(data); actual != expected)
			throw CorruptDataException(description + ": hash mismatch (expected " + ToHexString(expected) + ", got " + ToHexString(actual) + ")");
	}
}

#endif
