#ifndef UTIL_SHA256_HPP
#define UTIL_SHA256_HPP

#include <stdint.h>

#include <array>
#include <string>

namespace util {

class SHA256_t;

class SHA256 {
 public:
  static const constexpr uint32_t DIGEST_SIZE = (256 / 8);

  SHA256() : m_block{}, m_h{} { init(); }
  void init();
  void update(const unsigned char* message, size_t len);
  void update(const std::string& message) {
    update(reinterpret_cast<const unsigned char*>(message.data()),
           message.size());
  }
  void finalize(unsigned char* digest);
  void finalize(SHA256_t* digest);

  // Hex digest of data.
  static std::string Hex(const std::string& data);

 private:
  static const constexpr uint32_t SHA224_256_BLOCK_SIZE = (512 / 8);
  void transform(const unsigned char* message, size_t block_nb);
  uint64_t m_tot_len{0};
  size_t m_len{0};
  unsigned char m_block[2 * SHA224_256_BLOCK_SIZE];
  uint32_t m_h[8];
};

class SHA256_t : public std::array<uint8_t, SHA256::DIGEST_SIZE> {
 public:
  std::string Hex() const;

  bool isZero() const {
    for (const auto block : *this)
      if (block != 0) return false;
    return true;
  }
};

}  // namespace util
#endif
