#include <lockbox/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace lockbox::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

// 2^256 - 1 has 78 decimal digits.
constexpr auto kMaxAmountDigits = std::size_t{78};

}  // namespace

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<account_id_t> try_make_account_id(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != std::tuple_size_v<account_id_t>) {
    return std::nullopt;
  }
  auto account = account_id_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(account));
  return account;
}

std::string to_string(const account_id_t& account) {
  return "0x" + to_hex(bytes_view_t{account.data(), account.size()});
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty() || decimal.size() > kMaxAmountDigits) {
    return std::nullopt;
  }
  if (!std::ranges::all_of(decimal,
                           [](const char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  auto wide = boost::multiprecision::cpp_int{std::string{decimal}};
  if (wide > boost::multiprecision::cpp_int{
                 std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(wide);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace lockbox::schema
