#include "Storage.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <cstring>
#include <sodium.h>
#include <spdlog/spdlog.h>
#include "../core/Scheduler.hpp"

static const char MAGIC_HDR[] = "MNDECK1\n";
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES;
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

static std::string escapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\') out += "\\\\";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out.push_back(c);
    }
    return out;
}

static std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char next = s[++i];
            if (next == 'n') out.push_back('\n');
            else if (next == 'r') out.push_back('\r');
            else out.push_back(next);
        }
        else {
            out.push_back(s[i]);
        }
    }
    return out;
}

// Key derivation: Argon2id over the passphrase with the file's salt
static bool deriveKey(const std::string& passphrase, const unsigned char* salt, std::vector<unsigned char>& key) {
    spdlog::debug("Deriving deck key (not logging passphrase or salt)");

    key.assign(ENC_KEY_BYTES, 0);
    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt,
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation (likely out of memory)");
        key.clear();
        return false;
    }
    return true;
}

std::string Storage::serializeItems(const std::vector<Item>& items) {
    std::ostringstream oss;
    oss.precision(17);

    for (const auto& it : items) {
        oss << it.id << "\n"
            << escapeField(it.front) << "\n"
            << escapeField(it.back) << "\n"
            << it.interval << "\n"
            << it.ease_factor << "\n"
            << it.review_count << "\n";

        if (it.next_review) oss << *it.next_review << "\n";
        else oss << "-\n";

        oss << "---\n";
    }

    return oss.str();
}

bool Storage::parseItems(const std::string& plain, std::vector<Item>& items) {
    static const Scheduler bounds;
    std::istringstream iss(plain);
    items.clear();

    while (true) {
        Item it;
        if (!std::getline(iss, it.id)) break;

        std::string front, back, interval, ease, reviews, due, sep;
        if (!std::getline(iss, front) || !std::getline(iss, back) ||
            !std::getline(iss, interval) || !std::getline(iss, ease) ||
            !std::getline(iss, reviews) || !std::getline(iss, due) ||
            !std::getline(iss, sep) || sep != "---")
        {
            spdlog::error("Truncated item record '{}'", it.id);
            items.clear();
            return false;
        }

        it.front = unescapeField(front);
        it.back = unescapeField(back);

        try {
            it.interval = std::stod(interval);
            it.ease_factor = std::stod(ease);
            it.review_count = std::stoi(reviews);
            if (due != "-") it.next_review = static_cast<std::time_t>(std::stoll(due));
        }
        catch (const std::exception& e) {
            spdlog::error("Malformed scheduling data in item '{}': {}", it.id, e.what());
            items.clear();
            return false;
        }

        if (!std::isfinite(it.interval) || it.interval < bounds.minInterval() ||
            !std::isfinite(it.ease_factor) || it.ease_factor < bounds.minEase() ||
            it.ease_factor > bounds.maxEase() || it.review_count < 0)
        {
            spdlog::error("Scheduling data out of range in item '{}': interval={}, ease={}, reviews={}",
                it.id, it.interval, it.ease_factor, it.review_count);
            items.clear();
            return false;
        }

        items.push_back(it);
    }

    return true;
}

void Storage::upsert(std::vector<Item>& items, const Item& item) {
    auto it = std::find_if(items.begin(), items.end(),
        [&item](const Item& existing) { return existing.id == item.id; });
    if (it != items.end()) *it = item;
    else items.push_back(item);
}

bool Storage::saveItems(const std::vector<Item>& items, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Saving {} encrypted items to '{}'", items.size(), filename);

    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, sizeof(salt));

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::string plain = serializeItems(items);
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        sodium_memzero(key.data(), key.size());
        return false;
    }
    sodium_memzero(key.data(), key.size());

    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for encrypted write", filename);
        return false;
    }

    out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.write(reinterpret_cast<const char*>(salt), sizeof(salt));
    out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    if (!out) {
        spdlog::error("Short write to '{}'", filename);
        return false;
    }
    return true;
}

bool Storage::loadItems(std::vector<Item>& items, const std::string& filename, const std::string& passphrase) {
    spdlog::info("Loading encrypted items from '{}'", filename);
    items.clear();

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Item file '{}' not found; treating as empty", filename);
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    unsigned char salt[SALT_BYTES];
    in.read(reinterpret_cast<char*>(salt), sizeof(salt));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(salt))) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(nonce))) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> key;
    if (!deriveKey(passphrase, salt, key)) return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    const int opened = crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.data());
    sodium_memzero(key.data(), key.size());
    if (opened != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupt file)");
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    if (!parseItems(plain_str, items)) return false;

    spdlog::info("Loaded {} items", items.size());
    return true;
}
