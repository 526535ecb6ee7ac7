#include "util/misc.hpp"

#include <cctype>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isspace(static_cast<unsigned char>(s[begin]))) begin++;
  while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(begin, end - begin);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p));
    } catch (const std::exception&) {
      return false;
    }
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      unsigned long value = std::stoul(std::string(p));
      if (value > UINT32_MAX) return false;
      var = static_cast<uint32_t>(value);
    } catch (const std::exception&) {
      return false;
    }
    return true;
  };
};

}  // namespace util
