#include "trade_path.hpp"
#include <flarb/commons/flarb_log.hpp>
#include <algorithm>
#include <iterator>

namespace flarb {
namespace executor {

using model::balance_t;

static constexpr std::size_t word_size = 32;
static constexpr std::size_t address_size = address_t::size_bits / 8;


static void m_put_word(bytes_t &out, const balance_t &val)
{
    bytes_t tmp;
    export_bits(val, std::back_inserter(tmp), 8);
    out.insert(out.end(), word_size - tmp.size(), 0);
    out.insert(out.end(), tmp.begin(), tmp.end());
}

static void m_put_address(bytes_t &out, const address_t &a)
{
    const auto &val = reinterpret_cast<const address_t::base_type &>(a);
    out.insert(out.end(), word_size - address_size, 0);
    for (std::size_t i = 0; i < address_size; ++i)
    {
        out.push_back(static_cast<std::uint8_t>((val >> (8 * (address_size - 1 - i))) & 0xff));
    }
}

static void m_put_array(bytes_t &out, const token_path_t &items)
{
    m_put_word(out, items.size());
    for (auto &a: items)
    {
        m_put_address(out, a);
    }
}


/**
 * @brief reads the word at byte @p offset, as a size.
 *
 * Anything that does not fit the blob itself is bogus,
 * hence @p limit bounds the result.
 */
static std::size_t m_get_size(const bytes_t &data, std::size_t offset, std::size_t limit, const char *what)
{
    if (offset + word_size > data.size())
    {
        throw PathConsistencyError(strfmt("params truncated reading %1% at offset %2%", what, offset));
    }
    balance_t val;
    import_bits(val, data.begin() + offset, data.begin() + offset + word_size, 8);
    if (val > limit)
    {
        throw PathConsistencyError(strfmt("%1% out of bounds: %2%", what, val));
    }
    return static_cast<std::size_t>(val);
}

static address_t m_get_address(const bytes_t &data, std::size_t offset)
{
    auto begin = data.begin() + offset;
    if (std::any_of(begin, begin + (word_size - address_size), [](std::uint8_t b) { return b != 0; }))
    {
        throw PathConsistencyError(strfmt("dirty address padding at offset %1%", offset));
    }
    address_t res;
    auto &val = reinterpret_cast<address_t::base_type &>(res);
    for (auto i = begin + (word_size - address_size); i != begin + word_size; ++i)
    {
        val = (val << 8) | *i;
    }
    return res;
}

static token_path_t m_get_array(const bytes_t &data, std::size_t offset, std::size_t &end)
{
    const std::size_t words_left = (data.size() - offset) / word_size;
    const std::size_t len = m_get_size(data, offset, words_left - 1, "array length");
    token_path_t res;
    res.reserve(len);
    for (std::size_t i = 0; i < len; ++i)
    {
        res.emplace_back(m_get_address(data, offset + word_size * (i + 1)));
    }
    end = offset + word_size * (len + 1);
    return res;
}


TradePath TradePath::make(const token_path_t &path)
{
    TradePath res;
    res.path = path;
    res.reverse_path.assign(path.rbegin(), path.rend());
    return res;
}


void TradePath::check_consistency() const
{
    if (path.size() < 2)
    {
        throw PathConsistencyError(strfmt("path must cross at least two tokens, %1% given", path.size()));
    }
    for (std::size_t i = 0; i < path.size(); ++i)
    {
        if (path[i].is_zero())
        {
            throw PathConsistencyError(strfmt("zero address at step %1% of path", i));
        }
        if (i > 0 && path[i] == path[i-1])
        {
            throw PathConsistencyError(strfmt("token %1% repeated at step %2%", path[i], i));
        }
    }
    if (path.front() == path.back())
    {
        throw PathConsistencyError("path ends where it starts: no intermediate asset to hold");
    }
    if (reverse_path.size() != path.size() ||
            !std::equal(path.rbegin(), path.rend(), reverse_path.begin()))
    {
        throw PathConsistencyError(strfmt("reverse path {%1%} is not the mirror of {%2%}"
                                          , model::describe_path(reverse_path)
                                          , model::describe_path(path)));
    }
}


bytes_t TradePath::encode() const
{
    bytes_t res;
    res.reserve(word_size * (4 + path.size() + reverse_path.size()));
    const std::size_t head = word_size * 2;
    m_put_word(res, head);
    m_put_word(res, head + word_size * (1 + path.size()));
    m_put_array(res, path);
    m_put_array(res, reverse_path);
    return res;
}


TradePath TradePath::decode(const bytes_t &data)
{
    const std::size_t head = word_size * 2;
    if (data.size() < head + word_size * 2 || data.size() % word_size != 0)
    {
        throw PathConsistencyError(strfmt("malformed params: %1% bytes", data.size()));
    }
    const std::size_t off0 = m_get_size(data, 0, data.size(), "offset of path");
    const std::size_t off1 = m_get_size(data, word_size, data.size(), "offset of reverse path");
    if (off0 != head)
    {
        throw PathConsistencyError(strfmt("unexpected offset of path: %1%", off0));
    }

    TradePath res;
    std::size_t end = 0;
    res.path = m_get_array(data, off0, end);
    if (off1 != end)
    {
        throw PathConsistencyError(strfmt("unexpected offset of reverse path: %1%, should be %2%", off1, end));
    }
    if (end >= data.size())
    {
        throw PathConsistencyError("params truncated: reverse path missing");
    }
    res.reverse_path = m_get_array(data, off1, end);
    if (end != data.size())
    {
        throw PathConsistencyError(strfmt("%1% trailing bytes in params", data.size() - end));
    }
    return res;
}


std::ostream& operator<< (std::ostream& stream, const TradePath& o)
{
    stream << "{" << model::describe_path(o.path)
           << " | " << model::describe_path(o.reverse_path) << "}";
    return stream;
}


} // namespace executor
} // namespace flarb
