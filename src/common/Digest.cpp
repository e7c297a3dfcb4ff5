/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#include "common/Digest.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include <boost/format.hpp>
#include <boost/regex.hpp>
#include <openssl/evp.h>

#include "libdepot/Error.hpp"
#include "common/regex.hpp"


namespace depot {
namespace common {

const std::string Digest::sha256Algorithm = "sha256";

Digest::Digest(const std::string& algorithm, const std::string& hex)
    : algorithm{algorithm}
    , hex{hex}
{}

/**
 * Parses a digest string. The generic distribution grammar is accepted
 * syntactically, but only canonical SHA-256 digests (64 lowercase hex
 * characters) are supported.
 */
Digest Digest::parse(const std::string& digest) {
    boost::smatch matches;
    if(!boost::regex_match(digest, matches, regex::digest)) {
        auto message = boost::format("Invalid digest '%s': expected format <algorithm>:<hex>") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestInvalid, message.str());
    }

    auto algorithm = matches[1].str();
    auto hex = matches[2].str();

    if(algorithm != sha256Algorithm) {
        auto message = boost::format("Invalid digest '%s': unsupported algorithm '%s'") % digest % algorithm;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestInvalid, message.str());
    }
    if(hex.size() != 64 || hex.find_first_not_of("0123456789abcdef") != std::string::npos) {
        auto message = boost::format("Invalid digest '%s': a sha256 digest requires 64 lowercase hex characters") % digest;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestInvalid, message.str());
    }

    return Digest{algorithm, hex};
}

std::string Digest::string() const {
    return algorithm + ":" + hex;
}

bool operator==(const Digest& lhs, const Digest& rhs) {
    return lhs.getAlgorithm() == rhs.getAlgorithm() && lhs.getHex() == rhs.getHex();
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Digest& lhs, const Digest& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    os << digest.string();
    return os;
}

Sha256::Sha256()
    : context{EVP_MD_CTX_new()}
{
    if(context == nullptr) {
        DEPOT_THROW_ERROR("Failed to allocate OpenSSL digest context");
    }
    if(EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(context);
        DEPOT_THROW_ERROR("Failed to initialize OpenSSL SHA-256 digest context");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(context);
}

void Sha256::update(const char* data, std::size_t size) {
    if(finalized) {
        DEPOT_THROW_ERROR("Attempted to update a finalized SHA-256 hasher");
    }
    if(size == 0) {
        return;
    }
    if(EVP_DigestUpdate(context, data, size) != 1) {
        DEPOT_THROW_ERROR("Failed to update OpenSSL SHA-256 digest");
    }
}

void Sha256::update(const std::string& data) {
    update(data.data(), data.size());
}

Digest Sha256::finalize() {
    if(finalized) {
        DEPOT_THROW_ERROR("Attempted to finalize a SHA-256 hasher twice");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(context, hash, &length) != 1) {
        DEPOT_THROW_ERROR("Failed to finalize OpenSSL SHA-256 digest");
    }
    finalized = true;

    std::stringstream ss;
    for(unsigned int i=0; i<length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return Digest{Digest::sha256Algorithm, ss.str()};
}

namespace digest {

Digest compute(const std::string& bytes) {
    Sha256 hasher;
    hasher.update(bytes);
    return hasher.finalize();
}

Digest computeFile(const boost::filesystem::path& file) {
    std::ifstream ifs(file.string(), std::ios::binary);
    if(!ifs) {
        auto message = boost::format("Failed to open %s to compute its digest") % file;
        DEPOT_THROW_ERROR(message.str());
    }

    Sha256 hasher;
    char buffer[8192];
    while(ifs) {
        ifs.read(buffer, sizeof(buffer));
        if(ifs.bad()) {
            auto message = boost::format("Failed to read %s while computing its digest") % file;
            DEPOT_THROW_ERROR(message.str());
        }
        hasher.update(buffer, static_cast<std::size_t>(ifs.gcount()));
    }
    return hasher.finalize();
}

bool matches(const std::string& bytes, const Digest& expected) {
    return compute(bytes) == expected;
}

void verify(const std::string& bytes, const Digest& expected) {
    auto computed = compute(bytes);
    if(computed != expected) {
        auto message = boost::format("Digest mismatch: expected %s but content hashes to %s") % expected % computed;
        DEPOT_THROW_ERROR_CODE(libdepot::ErrorCode::DigestMismatch, message.str());
    }
}

}

}
}
