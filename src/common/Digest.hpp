/*
 * Depot
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */
#ifndef depot_common_Digest_hpp
#define depot_common_Digest_hpp

#include <string>
#include <ostream>
#include <cstddef>

#include <boost/filesystem.hpp>

struct evp_md_ctx_st;

namespace depot {
namespace common {

/**
 * Content identifier of the form <algorithm>:<hex>, e.g. "sha256:e3b0c4...".
 */
class Digest {
public:
    static const std::string sha256Algorithm;

public:
    Digest() = default;
    Digest(const std::string& algorithm, const std::string& hex);

    static Digest parse(const std::string& digest);

    const std::string& getAlgorithm() const { return algorithm; }
    const std::string& getHex() const { return hex; }
    std::string string() const;
    bool empty() const { return hex.empty(); }

private:
    std::string algorithm;
    std::string hex;
};

bool operator==(const Digest&, const Digest&);
bool operator!=(const Digest&, const Digest&);
bool operator<(const Digest&, const Digest&);
std::ostream& operator<<(std::ostream&, const Digest&);

/**
 * Incremental SHA-256 hasher backed by an OpenSSL EVP digest context.
 */
class Sha256 {
public:
    Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    ~Sha256();

    void update(const char* data, std::size_t size);
    void update(const std::string& data);
    Digest finalize();

private:
    evp_md_ctx_st* context;
    bool finalized = false;
};

namespace digest {

Digest compute(const std::string& bytes);
Digest computeFile(const boost::filesystem::path& file);
bool matches(const std::string& bytes, const Digest& expected);
void verify(const std::string& bytes, const Digest& expected);

}

}
}

#endif
