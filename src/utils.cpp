#include "utils.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <sstream>
#include <iomanip>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string check_env(const std::string& name, const std::optional<std::string>& expected){
    const char* raw = std::getenv(name.c_str());
    if(!raw) {
        if(expected) throw ConfigError("Must set " + name + "=" + *expected + " environment variable.");
        throw ConfigError("Must set " + name + " environment variable.");
    }
    std::string value(raw);
    if(expected && value != *expected) {
        throw ConfigError("Must set " + name + "=" + *expected + " environment variable.");
    }
    return value;
}

std::vector<std::string> split_words(const std::string& text){
    std::istringstream in(text);
    std::vector<std::string> out;
    std::string word;
    while(in >> word) out.push_back(word);
    return out;
}
