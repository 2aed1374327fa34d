#include "../include/util.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string gen_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

std::string sha1_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha1) failed");
    }
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 0.0f;
    return (float)(dot / (std::sqrt(na) * std::sqrt(nb)));
}

std::string normalize_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back((char)std::tolower(c));
    }
    return out;
}

double token_jaccard(const std::string& a, const std::string& b) {
    auto tokens = [](const std::string& s) {
        std::set<std::string> out;
        std::istringstream ss(s);
        std::string tok;
        while (ss >> tok) out.insert(tok);
        return out;
    };
    auto ta = tokens(a), tb = tokens(b);
    if (ta.empty() && tb.empty()) return 1.0;
    std::size_t common = 0;
    for (const auto& t : ta) common += tb.count(t);
    std::size_t total = ta.size() + tb.size() - common;
    return total == 0 ? 0.0 : (double)common / (double)total;
}
