#include "flarb_types.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <typeinfo>

namespace flarb {
namespace model {

address_t::address_t() : bignum::uint160_t(0) {}
address_t::address_t(const char *hexstring) : bignum::uint160_t(hexstring) {}
address_t::address_t(const std::string &hexstring) : bignum::uint160_t(hexstring.c_str()) {}

bool address_t::is_zero() const
{
    return reinterpret_cast<const address_t::base_type &>(*this) == 0;
}

std::string address_t::str() const
{
    std::stringstream ss;
    ss << *this;
    return ss.str();
}


static unsigned hex2nib(unsigned c)
{
    switch (c) {
    case '0':           return 0x0;
    case '1':           return 0x1;
    case '2':           return 0x2;
    case '3':           return 0x3;
    case '4':           return 0x4;
    case '5':           return 0x5;
    case '6':           return 0x6;
    case '7':           return 0x7;
    case '8':           return 0x8;
    case '9':           return 0x9;
    case 'a': case 'A': return 0xA;
    case 'b': case 'B': return 0xB;
    case 'c': case 'C': return 0xC;
    case 'd': case 'D': return 0xD;
    case 'e': case 'E': return 0xE;
    case 'f': case 'F': return 0xF;
    default:
        throw std::bad_cast();
    }
};


std::ostream& operator<< (std::ostream& stream, const address_t& o)
{
    std::stringstream ss;
    ss
            << std::hex
            << std::noshowbase
            << std::setfill('0')
            << std::setw(address_t::nibs)
            << reinterpret_cast<const address_t::base_type &>(o);

    stream << "0x" << ss.str();
    return stream;
}


std::string to_hex(const bytes_t &data)
{
    static const char digits[] = "0123456789abcdef";
    std::string res("0x");
    res.reserve(2 + data.size() * 2);
    for (auto b: data)
    {
        res.push_back(digits[b >> 4]);
        res.push_back(digits[b & 0x0f]);
    }
    return res;
}

bytes_t from_hex(const std::string &hexstring)
{
    std::size_t start = 0;
    if (boost::algorithm::istarts_with(hexstring, "0x"))
    {
        start = 2;
    }
    if ((hexstring.size() - start) % 2 != 0)
    {
        throw std::invalid_argument("odd-length hexstring");
    }
    bytes_t res;
    res.reserve((hexstring.size() - start) / 2);
    for (auto i = start; i < hexstring.size(); i += 2)
    {
        try {
            res.push_back(static_cast<std::uint8_t>((hex2nib(hexstring[i]) << 4) |
                                                     hex2nib(hexstring[i+1])));
        } catch (const std::bad_cast &) {
            throw std::invalid_argument("not a hexstring: " + hexstring);
        }
    }
    return res;
}

std::string describe_path(const token_path_t &path)
{
    std::vector<std::string> items;
    items.reserve(path.size());
    for (auto &t: path)
    {
        items.emplace_back(t.str());
    }
    return boost::algorithm::join(items, " -> ");
}


} // namespace model
} // namespace flarb
