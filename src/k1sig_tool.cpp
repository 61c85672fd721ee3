/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <k1sig/codec.hpp>
#include <k1sig/ecdsa.hpp>
#include <k1sig/error.hpp>
#include <k1sig/hash.hpp>
#include <k1sig/keys.hpp>
#include <k1sig/nonce.hpp>
#include <k1sig/params.hpp>
#include <util/csprng.hpp>
#include <util/log.hpp>
#include <util/mpz_bytes.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace k1sig;

namespace {

std::string required_string(const json& jconfig, const char *key) {
    if (!jconfig.contains(key)) {
        throw std::invalid_argument(std::string("missing \"") + key + "\"");
    }
    return jconfig[key].template get<std::string>();
}

// "digest" is hash output in hex; "message" is signed as its SHA-256
std::vector<uint8_t> read_digest(const json& jconfig) {
    if (jconfig.contains("digest")) {
        return codec::from_hex(jconfig["digest"].template get<std::string>());
    }

    const auto msg = required_string(jconfig, "message");
    const auto h = sha256::hash(std::string_view{ msg });
    return { h.data.begin(), h.data.end() };
}

int run_keygen(const ec::weierstrass_curve& curve, const json& jconfig) {
    std::optional<key_pair> kp;

    if (jconfig.contains("seed")) {
        const auto seed = codec::from_hex(jconfig["seed"].template get<std::string>());
        if (seed.size() != seeded_random_engine::seed_size) {
            throw invalid_encoding("seed must be "
                                   + std::to_string(seeded_random_engine::seed_size) + " bytes");
        }

        seeded_random_engine rng{ seed };
        kp.emplace(generate_keypair(curve, rng));
    }
    else {
        system_random_engine rng;
        kp.emplace(generate_keypair(curve, rng));
    }

    const bool compressed = jconfig.value("compressed", true);

    json out;
    out["private-key"] = mpz_to_hex(kp->private_key().data(), params::scalar_bytes);
    out["public-key"]  = codec::to_hex(codec::encode_point(curve, kp->public_key(), compressed));
    std::cout << out.dump(4) << std::endl;
    return EXIT_SUCCESS;
}

int run_sign(const ec::weierstrass_curve& curve, const json& jconfig) {
    const auto d = parse_private_key(curve, mpz_from_hex(required_string(jconfig, "private-key")));
    const auto digest = read_digest(jconfig);
    const auto nonce = jconfig.value("nonce", std::string{ "rfc6979" });

    signature sig;
    if (nonce == "rfc6979") {
        rfc6979_nonce_source nonces;
        sig = sign(curve, d, std::span<const uint8_t>{ digest }, nonces);
    }
    else if (nonce == "random") {
        system_random_engine rng;
        random_nonce_source nonces{ rng };
        sig = sign(curve, d, std::span<const uint8_t>{ digest }, nonces);
    }
    else {
        throw std::invalid_argument("unknown nonce source: " + nonce);
    }

    const auto compact = codec::encode_compact(sig);

    json out;
    out["signature"] = codec::to_hex(compact);
    out["der"]       = codec::to_hex(codec::encode_der(sig));
    std::cout << out.dump(4) << std::endl;
    return EXIT_SUCCESS;
}

int run_verify(const ec::weierstrass_curve& curve, const json& jconfig) {
    const auto q = codec::decode_point(curve, codec::from_hex(required_string(jconfig, "public-key")));
    const auto digest = read_digest(jconfig);

    signature sig;
    if (jconfig.contains("der")) {
        sig = codec::decode_der(codec::from_hex(jconfig["der"].template get<std::string>()));
    }
    else {
        sig = codec::decode_compact(codec::from_hex(required_string(jconfig, "signature")));
    }

    const auto status = verify_signature(curve, q, std::span<const uint8_t>{ digest }, sig);

    json out;
    out["valid"]  = (status == verify_status::valid);
    out["status"] = to_string(status);
    std::cout << out.dump(4) << std::endl;
    return status == verify_status::valid ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, const char *argv[]) {
    if (argc < 2) {
        std::cerr << "k1sig v" << K1SIG_VERSION_MAJOR << "."
                  << K1SIG_VERSION_MINOR << "."
                  << K1SIG_VERSION_PATCH << std::endl;
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::string_view jstr = argv[1];
    json jconfig;

    try {
        jconfig = json::parse(jstr);
    }
    catch (json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    try {
        set_logging_level(parse_log_level(jconfig.value("log-level", std::string{ "info" })));

        const auto& curve = ec::secp256k1();
        const auto command = required_string(jconfig, "command");

        if (command == "keygen") {
            return run_keygen(curve, jconfig);
        }
        else if (command == "sign") {
            return run_sign(curve, jconfig);
        }
        else if (command == "verify") {
            return run_verify(curve, jconfig);
        }

        std::cerr << "Invalid command: " << command << std::endl;
        return EXIT_FAILURE;
    }
    catch (const k1sig::error& e) {
        std::cerr << "Error (" << to_string(e.code()) << "): " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
