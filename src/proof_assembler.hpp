#pragma once

#include <string>
#include <vector>
#include "proof_types.hpp"

namespace txproof {

// What to do with a segwit transaction whose block carries no usable
// witness commitment
enum class CommitmentPolicy {
    Fail,     // Reject with WitnessCommitmentNotFound
    Degrade   // Return the proof with the commitment left out
};

const char* to_string(CommitmentPolicy policy);
CommitmentPolicy parse_commitment_policy(const std::string& name);

// ProofAssembler turns a fetched block into a TransactionProofSet.
// It does no I/O and keeps no state besides its policy.
class ProofAssembler {
public:
    explicit ProofAssembler(CommitmentPolicy policy = CommitmentPolicy::Fail) : policy_(policy) {}

    TransactionProofSet assemble(const BlockRef& block,
                                 const std::vector<TxRecord>& transactions,
                                 const std::string& target_txid) const;

    CommitmentPolicy policy() const { return policy_; }

private:
    CommitmentPolicy policy_;
};

} // namespace txproof
