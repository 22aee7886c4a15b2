#pragma once
#include <vector>
#include <string>
#include "../core/Item.hpp"

// Storage keeps one encrypted deck file per user.
//
// File layout:
//   Header: 8 bytes ASCII "MNDECK1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (key derivation from the passphrase)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Plaintext is line based, one block per item terminated by "---".
// Front/back escape '\\' and newlines so multi-line backs survive.

class Storage {
public:
    static bool saveItems(const std::vector<Item>& items, const std::string& filename, const std::string& passphrase);

    // A missing file is an empty deck (returns true). Wrong passphrase or a
    // corrupt file returns false and leaves `items` empty.
    static bool loadItems(std::vector<Item>& items, const std::string& filename, const std::string& passphrase);

    // Replaces the stored copy of `item` (matched by id) or appends it.
    static void upsert(std::vector<Item>& items, const Item& item);

    static std::string serializeItems(const std::vector<Item>& items);
    static bool parseItems(const std::string& plain, std::vector<Item>& items);
};
