#pragma once
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);

// Random 128-bit hex id, used for run ids.
std::string gen_id();

std::string sha1_hex(const std::string& data);

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Lower-cases, trims and collapses runs of whitespace to a single space.
std::string normalize_text(const std::string& text);

// Jaccard index of the whitespace-separated token sets of two normalized strings.
double token_jaccard(const std::string& a, const std::string& b);
