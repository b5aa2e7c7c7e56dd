#include <mlget/downloader/downloader.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace mlget::downloader {

namespace {

constexpr std::array<std::pair<HashAlgo, std::string_view>, 9> kHashNames{{
    {HashAlgo::Md2, "md2"},
    {HashAlgo::Md5, "md5"},
    {HashAlgo::Sha1, "sha-1"},
    {HashAlgo::Sha224, "sha-224"},
    {HashAlgo::Sha256, "sha-256"},
    {HashAlgo::Sha384, "sha-384"},
    {HashAlgo::Sha512, "sha-512"},
    {HashAlgo::Shake128, "shake128"},
    {HashAlgo::Shake256, "shake256"},
}};

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<HashAlgo> parseHashAlgo(std::string_view name) {
    for (const auto& [algo, text] : kHashNames) {
        if (iequals(name, text))
            return algo;
    }
    return std::nullopt;
}

std::string_view hashAlgoName(HashAlgo algo) {
    for (const auto& [a, text] : kHashNames) {
        if (a == algo)
            return text;
    }
    return "unknown";
}

bool isVerifiable(HashAlgo algo) {
    return algo != HashAlgo::Shake128 && algo != HashAlgo::Shake256;
}

std::optional<FailurePolicy> parseFailurePolicy(std::string_view name) {
    if (iequals(name, "cancel-run"))
        return FailurePolicy::CancelRun;
    if (iequals(name, "cancel-file"))
        return FailurePolicy::CancelFile;
    return std::nullopt;
}

std::string_view failurePolicyName(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::CancelRun:
            return "cancel-run";
        case FailurePolicy::CancelFile:
            return "cancel-file";
    }
    return "cancel-run";
}

} // namespace mlget::downloader
