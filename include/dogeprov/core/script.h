// DOGEPROV - Script Header
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Output scripts for the standard Dogecoin address types. Script execution
// belongs to the node and is not modelled here.

#ifndef DOGEPROV_CORE_SCRIPT_H
#define DOGEPROV_CORE_SCRIPT_H

#include "dogeprov/core/types.h"
#include "dogeprov/core/serialize.h"
#include <cstdint>
#include <vector>

namespace dogeprov {

/// Opcodes used by standard output templates
enum Opcode : uint8_t {
    OP_DUP = 0x76,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,
};

/// Serialized script, used inside transaction inputs and outputs
class Script : public std::vector<uint8_t> {
public:
    using base_type = std::vector<uint8_t>;
    using base_type::base_type;

    Script& operator<<(Opcode opcode);

    /// Push a 20-byte hash with its length prefix
    Script& operator<<(const Hash160& hash);

    /// OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
    static Script CreateP2PKH(const Hash160& pubKeyHash);

    /// OP_HASH160 <20 bytes> OP_EQUAL
    static Script CreateP2SH(const Hash160& scriptHash);
};

template<typename Stream>
void Serialize(Stream& s, const Script& script) {
    Serialize(s, static_cast<const std::vector<uint8_t>&>(script));
}

template<typename Stream>
void Unserialize(Stream& s, Script& script) {
    Unserialize(s, static_cast<std::vector<uint8_t>&>(script));
}

} // namespace dogeprov

#endif // DOGEPROV_CORE_SCRIPT_H
