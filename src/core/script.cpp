// DOGEPROV - Script Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/core/script.h"

namespace dogeprov {

Script& Script::operator<<(Opcode opcode) {
    push_back(static_cast<uint8_t>(opcode));
    return *this;
}

Script& Script::operator<<(const Hash160& hash) {
    push_back(static_cast<uint8_t>(Hash160::SIZE));
    insert(end(), hash.begin(), hash.end());
    return *this;
}

Script Script::CreateP2PKH(const Hash160& pubKeyHash) {
    Script script;
    script << OP_DUP << OP_HASH160 << pubKeyHash << OP_EQUALVERIFY << OP_CHECKSIG;
    return script;
}

Script Script::CreateP2SH(const Hash160& scriptHash) {
    Script script;
    script << OP_HASH160 << scriptHash << OP_EQUAL;
    return script;
}

} // namespace dogeprov
