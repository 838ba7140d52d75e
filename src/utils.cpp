#include "utils.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string base64_encode(const char* data, std::size_t size){
    if(size == 0) return {};
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data),
                                  static_cast<int>(size));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string base64_encode(const std::vector<char>& data){
    return base64_encode(data.data(), data.size());
}

std::vector<char> base64_decode(const std::string& encoded){
    if(encoded.empty()) return {};
    if(encoded.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    std::vector<char> out(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(written < 0) throw std::invalid_argument("malformed base64 payload");
    // EVP_DecodeBlock counts the padding as zero bytes
    std::size_t padding = 0;
    if(encoded[encoded.size() - 1] == '=') ++padding;
    if(encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

bool is_valid_utf8(const std::string& text){
    std::size_t i = 0;
    const std::size_t n = text.size();
    while(i < n){
        auto c = static_cast<unsigned char>(text[i]);
        if(c < 0x80){ ++i; continue; }
        std::size_t len;
        uint32_t cp;
        if((c & 0xE0) == 0xC0){ len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ len = 4; cp = c & 0x07; }
        else return false;
        if(i + len > n) return false;
        for(std::size_t k = 1; k < len; ++k){
            auto cc = static_cast<unsigned char>(text[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        static const uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
        if(cp < min_for_len[len]) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string format_size(uint64_t bytes){
    if(bytes < 1024) return std::to_string(bytes) + "b";
    static const char* suffixes[] = {"B", "K", "M", "G", "T", "P"};
    constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(idx + 1 < suffix_count && value >= 1024.0){
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value >= 100 ? 0 : (value >= 10 ? 1 : 2)) << value;
    std::string out = oss.str();
    if(out.find('.') != std::string::npos){
        while(out.back() == '0') out.pop_back();
        if(out.back() == '.') out.pop_back();
    }
    return out + suffixes[idx];
}

std::filesystem::path absolute_normalized(const std::filesystem::path& path,
                                          const std::filesystem::path& base){
    std::filesystem::path joined = path.is_absolute() ? path : base / path;
    auto normal = joined.lexically_normal();
    // "a/b/" normalises to "a/b/" with an empty filename; drop it
    if(!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()){
        normal = normal.parent_path();
    }
    return normal;
}
