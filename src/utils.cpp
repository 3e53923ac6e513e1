#include "utils.hpp"
#include <openssl/sha.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(std::string_view data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return hex_from_bytes(out);
}

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error){
    std::ifstream in(path, std::ios::binary);
    if(!in){
        error = "open " + path.string() + ": " + std::strerror(errno);
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if(in.bad()){
        error = "read " + path.string() + " failed";
        return false;
    }
    out = buffer.str();
    return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& text, std::string& error){
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out){
        error = "open " + path.string() + " for writing: " + std::strerror(errno);
        return false;
    }
    out << text;
    out.flush();
    if(!out){
        error = "write " + path.string() + " failed";
        return false;
    }
    return true;
}
