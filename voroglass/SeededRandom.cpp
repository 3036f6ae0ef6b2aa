#include "SeededRandom.hpp"

#include <random>

using namespace voroglass;

namespace
{
constexpr uint32_t kReplacementCharacter = 0xFFFD;

// Decodes the code point starting at str[i] and advances i past it. A malformed sequence yields U+FFFD and consumes
// one byte.
uint32_t decodeUtf8(const std::string& str, size_t& i)
{
  unsigned char lead = static_cast<unsigned char>(str[i]);
  size_t length = 0;
  uint32_t code_point = 0;
  if (lead < 0x80)
  {
    ++i;
    return lead;
  }
  else if ((lead & 0xE0) == 0xC0)
  {
    length = 2;
    code_point = lead & 0x1F;
  }
  else if ((lead & 0xF0) == 0xE0)
  {
    length = 3;
    code_point = lead & 0x0F;
  }
  else if ((lead & 0xF8) == 0xF0)
  {
    length = 4;
    code_point = lead & 0x07;
  }
  else
  {
    ++i;
    return kReplacementCharacter;
  }

  if (i + length > str.size())
  {
    ++i;
    return kReplacementCharacter;
  }

  for (size_t k = 1; k < length; ++k)
  {
    unsigned char continuation = static_cast<unsigned char>(str[i + k]);
    if ((continuation & 0xC0) != 0x80)
    {
      ++i;
      return kReplacementCharacter;
    }
    code_point = (code_point << 6) | (continuation & 0x3F);
  }

  // overlong forms, surrogates and values past U+10FFFF are not valid UTF-8
  static constexpr uint32_t kMinimum[] = { 0, 0, 0x80, 0x800, 0x10000 };
  if (code_point < kMinimum[length] || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
  {
    ++i;
    return kReplacementCharacter;
  }

  i += length;
  return code_point;
}
}

SeededRandom::SeededRandom(uint32_t seed)
  : state(seed)
{
}

SeededRandom::SeededRandom(const std::optional<std::string>& seed)
  : state(0)
{
  if (seed)
  {
    state = hashString(*seed);
  }
  else
  {
    std::random_device device;
    state = static_cast<uint32_t>(device());
  }
}

double SeededRandom::next()
{
  // all arithmetic is modulo 2^32
  state += 0x6D2B79F5u;
  uint32_t t = (state ^ (state >> 15)) * (1u | state);
  t = (t + (t ^ (t >> 7)) * (61u | t)) ^ t;
  return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
}

uint32_t SeededRandom::hashString(const std::string& str)
{
  uint32_t h = 0;
  size_t i = 0;
  while (i < str.size())
  {
    uint32_t code_point = decodeUtf8(str, i);
    if (code_point >= 0x10000)
    {
      // surrogate pair
      code_point -= 0x10000;
      h = 31u * h + (0xD800u + (code_point >> 10));
      h = 31u * h + (0xDC00u + (code_point & 0x3FF));
    }
    else
    {
      h = 31u * h + code_point;
    }
  }
  return h;
}
