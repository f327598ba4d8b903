#ifndef EDDY_BITFIELD_HEADER
#define EDDY_BITFIELD_HEADER

#include "interval.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace eddy {

/**
 * The verified-piece map of a store. As in the BitTorrent wire format, the first bit
 * is the most significant bit of the first byte, and the excess bits of the last byte
 * are always kept zero.
 */
class bitfield
{
public:
    using size_type = size_t;
    using block_type = uint8_t;

private:
    std::vector<block_type> blocks_;
    size_type num_bits_ = 0;

public:
    bitfield() = default;

    explicit bitfield(size_type num_bits, bool initial_val = false)
        : blocks_(num_blocks_for(num_bits), initial_val ? ~block_type(0) : 0)
        , num_bits_(num_bits)
    {
        clear_unused_bits();
    }

    /** Returns the number of bits, not the bytes needed to store them. */
    size_type size() const noexcept { return num_bits_; }

    const std::vector<block_type>& data() const noexcept { return blocks_; }

    bool get(const size_type bit) const noexcept { return (*this)[bit]; }

    bool operator[](const size_type bit) const noexcept
    {
        return (blocks_[bit / bits_per_block()] & make_bit_mask(bit)) != 0;
    }

    bool at(const size_type bit) const
    {
        if(bit >= num_bits_) {
            throw std::out_of_range("bitfield element out of range");
        }
        return (*this)[bit];
    }

    bitfield& set(const size_type bit) noexcept
    {
        blocks_[bit / bits_per_block()] |= make_bit_mask(bit);
        return *this;
    }

    bitfield& reset(const size_type bit) noexcept
    {
        blocks_[bit / bits_per_block()] &= ~make_bit_mask(bit);
        return *this;
    }

    bitfield& fill() noexcept
    {
        std::fill(blocks_.begin(), blocks_.end(), ~block_type(0));
        clear_unused_bits();
        return *this;
    }

    bitfield& clear() noexcept
    {
        std::fill(blocks_.begin(), blocks_.end(), block_type(0));
        return *this;
    }

    /** Returns the Hamming weight of this bitfield. */
    size_type count() const noexcept
    {
        size_type n = 0;
        for(size_type i = 0; i < size(); ++i) {
            if((*this)[i]) {
                ++n;
            }
        }
        return n;
    }

    bool are_all_set() const noexcept { return count() == size(); }
    bool are_none_set() const noexcept
    {
        return std::all_of(blocks_.begin(), blocks_.end(),
                [](const block_type b) { return b == 0; });
    }

    /** Tests whether every bit in the half-open range is set. */
    bool are_all_set(const interval& bits) const noexcept
    {
        for(auto i = bits.begin; i < bits.end; ++i) {
            if(!(*this)[i]) {
                return false;
            }
        }
        return true;
    }

    std::string to_string() const
    {
        std::string s(size(), '0');
        for(size_type i = 0; i < size(); ++i) {
            if((*this)[i]) {
                s[i] = '1';
            }
        }
        return s;
    }

    friend bool operator==(const bitfield& a, const bitfield& b) noexcept
    {
        return (a.num_bits_ == b.num_bits_) && (a.blocks_ == b.blocks_);
    }

    friend bool operator!=(const bitfield& a, const bitfield& b) noexcept
    {
        return !(a == b);
    }

private:
    static constexpr size_type bits_per_block() noexcept
    {
        return sizeof(block_type) * 8;
    }

    static size_type num_blocks_for(const size_type num_bits) noexcept
    {
        return (num_bits + bits_per_block() - 1) / bits_per_block();
    }

    static block_type make_bit_mask(const size_type bit) noexcept
    {
        return block_type(0x80) >> (bit % bits_per_block());
    }

    void clear_unused_bits() noexcept
    {
        const size_type num_excess = blocks_.size() * bits_per_block() - num_bits_;
        if(num_excess > 0) {
            blocks_.back() &= block_type(0xff << num_excess);
        }
    }
};

} // namespace eddy

#endif // EDDY_BITFIELD_HEADER
