#include "witness_commitment.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <algorithm>
#include <cstring>

namespace txproof {

// Locate the witness commitment in a coinbase transaction
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki#commitment-structure
//
// The commitment lives in an output whose scriptPubKey starts with:
// - 0x6a      : OP_RETURN
// - 0x24      : push 36 bytes
// - aa21a9ed  : commitment header
// - [32 bytes]: SHA256d(witness root || witness reserved value)
std::optional<Hash256> WitnessCommitmentResolver::extract_commitment(std::span<const uint8_t> coinbase_raw) {
    const size_t needed = WITNESS_COMMITMENT_MARKER.size() + HASH_SIZE;
    std::optional<Hash256> found;

    if (coinbase_raw.size() < needed) {
        return found;
    }

    for (size_t pos = 0; pos + needed <= coinbase_raw.size(); ++pos) {
        if (!std::equal(WITNESS_COMMITMENT_MARKER.begin(), WITNESS_COMMITMENT_MARKER.end(),
                        coinbase_raw.begin() + pos)) {
            continue;
        }

        Hash256 candidate;
        std::memcpy(candidate.data(), coinbase_raw.data() + pos + WITNESS_COMMITMENT_MARKER.size(), HASH_SIZE);
        if (!HashUtils::is_zero(candidate)) {
            found = candidate;
        }
    }

    return found;
}

std::optional<Hash256> WitnessCommitmentResolver::extract_commitment_hex(const std::string& coinbase_raw_hex) {
    return extract_commitment(HexUtils::decode(coinbase_raw_hex));
}

Hash256 WitnessCommitmentResolver::compute_commitment(const Hash256& witness_merkle_root,
                                                      const Hash256& reserved_value) {
    return HashUtils::hash_pair(witness_merkle_root, reserved_value);
}

bool WitnessCommitmentResolver::verify(const Hash256& witness_merkle_root,
                                       const Hash256& reserved_value,
                                       const Hash256& expected_commitment) {
    return compute_commitment(witness_merkle_root, reserved_value) == expected_commitment;
}

// The coinbase input's witness must be a single 32-byte item, the
// witness reserved value. Nodes leave it all zero today.
Hash256 WitnessCommitmentResolver::reserved_value(const ParsedTransaction& coinbase) {
    Hash256 reserved{};
    if (!coinbase.witnesses.empty() && coinbase.witnesses.front().size() == 1 &&
        coinbase.witnesses.front().front().size() == HASH_SIZE) {
        const auto& item = coinbase.witnesses.front().front();
        std::copy(item.begin(), item.end(), reserved.begin());
    }
    return reserved;
}

std::optional<WitnessCommitment> WitnessCommitmentResolver::resolve(const Hash256& witness_merkle_root,
                                                                    const ParsedTransaction& coinbase) {
    if (HashUtils::is_zero(witness_merkle_root)) {
        return std::nullopt;
    }

    auto embedded = extract_commitment(coinbase.raw);
    if (!embedded) {
        return std::nullopt;
    }

    WitnessCommitment commitment;
    commitment.witness_merkle_root = witness_merkle_root;
    commitment.reserved_value = reserved_value(coinbase);
    commitment.commitment_hash = compute_commitment(commitment.witness_merkle_root, commitment.reserved_value);

    if (commitment.commitment_hash != *embedded) {
        throw ProofError(ErrorKind::WitnessCommitmentMismatch,
            "Coinbase commits to " + HexUtils::encode(*embedded) +
            " but witness root " + HexUtils::encode(witness_merkle_root) +
            " yields " + HexUtils::encode(commitment.commitment_hash));
    }

    return commitment;
}

} // namespace txproof
