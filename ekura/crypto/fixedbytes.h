/*=============================================================================

Fixed-size opaque byte values used throughout the platform: 256 bit digests
and 160 bit identity addresses. Both are ordered (usable as map keys),
printable as hex and serializable with boost.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_FIXEDBYTES_H
#define EKURA_FIXEDBYTES_H

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/serialization/access.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/base_object.hpp>

// ----------------------------------------------------------------
template<unsigned int BYTES>
class FixedBytes
{
public:

    static const unsigned int WIDTH = BYTES;

    FixedBytes() { SetNull(); }

    explicit FixedBytes(const std::vector<unsigned char>& vch)
    {
        if (vch.size() != BYTES)
            throw std::invalid_argument("Wrong number of bytes for fixed size value");

        memcpy(data, &vch[0], BYTES);
    }

    // ----------------------------------------------------------------

    bool IsNull() const
    {
        for (unsigned int i = 0; i < BYTES; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull() { memset(data, 0, BYTES); }

    unsigned char* begin() { return data; }
    unsigned char* end() { return data + BYTES; }
    const unsigned char* begin() const { return data; }
    const unsigned char* end() const { return data + BYTES; }

    unsigned int size() const { return BYTES; }

    std::vector<unsigned char> ToVector() const
    {
        return std::vector<unsigned char>(begin(), end());
    }

    // Hex representation, most significant byte first (no prefix)
    std::string GetHex() const
    {
        static const char digits[] = "0123456789abcdef";
        std::string result(BYTES * 2, '0');
        for (unsigned int i = 0; i < BYTES; i++)
        {
            result[2 * i] = digits[data[i] >> 4];
            result[2 * i + 1] = digits[data[i] & 0x0f];
        }
        return result;
    }

    // Parse hex (an optional 0x prefix is skipped), returns false on malformed input
    bool SetHex(const std::string& str)
    {
        std::string hex = str;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
            hex = hex.substr(2);

        if (hex.size() != BYTES * 2)
            return false;

        unsigned char parsed[BYTES];
        for (unsigned int i = 0; i < BYTES; i++)
        {
            int hi = HexDigit(hex[2 * i]);
            int lo = HexDigit(hex[2 * i + 1]);
            if (hi < 0 || lo < 0)
                return false;
            parsed[i] = static_cast<unsigned char>((hi << 4) | lo);
        }

        memcpy(data, parsed, BYTES);
        return true;
    }

    // ----------------------------------------------------------------

    friend inline bool operator==(const FixedBytes& a, const FixedBytes& b)
    {
        return memcmp(a.data, b.data, BYTES) == 0;
    }

    friend inline bool operator!=(const FixedBytes& a, const FixedBytes& b)
    {
        return memcmp(a.data, b.data, BYTES) != 0;
    }

    friend inline bool operator<(const FixedBytes& a, const FixedBytes& b)
    {
        return memcmp(a.data, b.data, BYTES) < 0;
    }

protected:

    unsigned char data[BYTES];

private:

    static int HexDigit(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::make_array(this->data, BYTES);
    }
};

// ----------------------------------------------------------------
// A 256 bit digest (SHA3-256 output, salts, separators)
typedef FixedBytes<32> Hash256;

// ----------------------------------------------------------------
// An identity: the Hash160 of a compressed public key, or a contract address
class Address : public FixedBytes<20>
{
public:
    Address() : FixedBytes<20>() { }
    explicit Address(const std::vector<unsigned char>& vch) : FixedBytes<20>(vch) { }

    // Parse from hex, throws on malformed input
    static Address FromHex(const std::string& str)
    {
        Address result;
        if (!result.SetHex(str))
            throw std::invalid_argument("Could not parse " + str + " as an address!");
        return result;
    }

    std::string ToString() const
    {
        return "0x" + GetHex();
    }

private:

    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & boost::serialization::base_object< FixedBytes<20> >(*this);
    }
};

#endif // EKURA_FIXEDBYTES_H
