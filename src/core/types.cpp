// AMOCA - Core Types Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/core/types.h>
#include <amoca/core/hex.h>

#include <sstream>

namespace amoca {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    
    std::vector<Byte> bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Amount Formatting
// ============================================================================

std::string FormatAmount(Amount amount) {
    std::string frac = std::to_string(amount % COIN);
    frac.insert(0, DECIMALS - frac.size(), '0');
    
    std::ostringstream oss;
    oss << (amount / COIN) << "." << frac;
    return oss.str();
}

bool ParseAmount(const std::string& str, Amount& out) {
    if (str.empty()) {
        return false;
    }
    
    size_t dot = str.find('.');
    std::string whole = str.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : str.substr(dot + 1);
    
    if ((whole.empty() && frac.empty()) || frac.size() > static_cast<size_t>(DECIMALS)) {
        return false;
    }
    
    for (char c : whole + frac) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    
    frac.append(DECIMALS - frac.size(), '0');
    
    Amount units = 0;
    for (char c : whole) {
        Amount digit = static_cast<Amount>(c - '0');
        if (units > (MAX_AMOUNT - digit) / 10) {
            return false;
        }
        units = units * 10 + digit;
    }
    if (units > MAX_AMOUNT / COIN) {
        return false;
    }
    units *= COIN;
    
    Amount fraction = std::stoull(frac);
    if (units > MAX_AMOUNT - fraction) {
        return false;
    }
    
    out = units + fraction;
    return true;
}

} // namespace amoca
