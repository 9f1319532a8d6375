// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_SERIALIZE_H
#define CROWDFUND_SERIALIZE_H

#include "amount.h"

#include <ios>
#include <stdint.h>
#include <string>
#include <utility>

/**
 * Disk serialization for ledger records.
 *
 * Integers are little-endian except where a record key needs to sort in
 * numeric order inside LevelDB; those use ser_writedata64be directly.
 */

static const unsigned int MAX_SIZE = 0x02000000;

/*
 * Lowest-level serialization and conversion.
 */
template<typename Stream> inline void ser_writedata8(Stream& s, uint8_t obj)
{
    s.write((char*)&obj, 1);
}
template<typename Stream> inline void ser_writedata32(Stream& s, uint32_t obj)
{
    unsigned char buf[4];
    for (int i = 0; i < 4; i++) buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 4);
}
template<typename Stream> inline void ser_writedata64(Stream& s, uint64_t obj)
{
    unsigned char buf[8];
    for (int i = 0; i < 8; i++) buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 8);
}
template<typename Stream> inline void ser_writedata64be(Stream& s, uint64_t obj)
{
    unsigned char buf[8];
    for (int i = 0; i < 8; i++) buf[7 - i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 8);
}
template<typename Stream> inline uint8_t ser_readdata8(Stream& s)
{
    uint8_t obj;
    s.read((char*)&obj, 1);
    return obj;
}
template<typename Stream> inline uint32_t ser_readdata32(Stream& s)
{
    unsigned char buf[4];
    s.read((char*)buf, 4);
    uint32_t obj = 0;
    for (int i = 0; i < 4; i++) obj |= (uint32_t)buf[i] << (8 * i);
    return obj;
}
template<typename Stream> inline uint64_t ser_readdata64(Stream& s)
{
    unsigned char buf[8];
    s.read((char*)buf, 8);
    uint64_t obj = 0;
    for (int i = 0; i < 8; i++) obj |= (uint64_t)buf[i] << (8 * i);
    return obj;
}
template<typename Stream> inline uint64_t ser_readdata64be(Stream& s)
{
    unsigned char buf[8];
    s.read((char*)buf, 8);
    uint64_t obj = 0;
    for (int i = 0; i < 8; i++) obj |= (uint64_t)buf[7 - i] << (8 * i);
    return obj;
}

/////////////////////////////////////////////////////////////////
//
// Templates for serializing to anything that looks like a stream,
// i.e. anything that supports .read(char*, size_t) and .write(char*, size_t)
//

template<typename Stream> inline void Serialize(Stream& s, char a    ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint8_t a ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a ) { ser_writedata64(s, (uint64_t)a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream> inline void Serialize(Stream& s, bool a    ) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream> inline void Unserialize(Stream& s, char& a    ) { a = (char)ser_readdata8(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint8_t& a ) { a = ser_readdata8(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& a ) { a = (int64_t)ser_readdata64(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }
template<typename Stream> inline void Unserialize(Stream& s, bool& a    ) { a = ser_readdata8(s) != 0; }

/** CAmount: 16 bytes, low word first */
template<typename Stream> inline void Serialize(Stream& s, const CAmount& a)
{
    ser_writedata64(s, (uint64_t)a);
    ser_writedata64(s, (uint64_t)(a >> 64));
}
template<typename Stream> inline void Unserialize(Stream& s, CAmount& a)
{
    CAmount lo = ser_readdata64(s);
    CAmount hi = ser_readdata64(s);
    a = (hi << 64) | lo;
}

/** Strings: 32-bit length prefix followed by the raw bytes */
template<typename Stream> void Serialize(Stream& s, const std::string& str)
{
    ser_writedata32(s, (uint32_t)str.size());
    if (!str.empty())
        s.write(str.data(), str.size());
}
template<typename Stream> void Unserialize(Stream& s, std::string& str)
{
    uint32_t nSize = ser_readdata32(s);
    if (nSize > MAX_SIZE)
        throw std::ios_base::failure("string length too large");
    str.resize(nSize);
    if (nSize != 0)
        s.read((char*)str.data(), nSize);
}

template<typename Stream, typename K, typename T> void Serialize(Stream& s, const std::pair<K, T>& item)
{
    Serialize(s, item.first);
    Serialize(s, item.second);
}
template<typename Stream, typename K, typename T> void Unserialize(Stream& s, std::pair<K, T>& item)
{
    Unserialize(s, item.first);
    Unserialize(s, item.second);
}

/** Anything else: delegate to the member functions */
template<typename Stream, typename T>
inline void Serialize(Stream& os, const T& a)
{
    a.Serialize(os);
}

template<typename Stream, typename T>
inline void Unserialize(Stream& is, T&& a)
{
    a.Unserialize(is);
}

/*
 * Support for SERIALIZE_METHODS and READWRITE macro.
 */
struct CSerActionSerialize
{
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize
{
    constexpr bool ForRead() const { return true; }
};

template<typename Stream>
void SerializeMany(Stream& s)
{
}

template<typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream& s, const Arg& arg, const Args&... args)
{
    ::Serialize(s, arg);
    ::SerializeMany(s, args...);
}

template<typename Stream>
inline void UnserializeMany(Stream& s)
{
}

template<typename Stream, typename Arg, typename... Args>
inline void UnserializeMany(Stream& s, Arg&& arg, Args&&... args)
{
    ::Unserialize(s, arg);
    ::UnserializeMany(s, args...);
}

template<typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionSerialize ser_action, const Args&... args)
{
    ::SerializeMany(s, args...);
}

template<typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionUnserialize ser_action, Args&&... args)
{
    ::UnserializeMany(s, args...);
}

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

/**
 * Implement the Serialize and Unserialize methods by delegating to a single
 * templated static method that takes the to-be-(de)serialized object as a
 * parameter. This approach has the advantage that the constness of the
 * object becomes a template parameter, and thus allows a single
 * implementation that sees the object as const for serializing and
 * non-const for deserializing, without casts.
 */
#define SERIALIZE_METHODS(cls, obj)                                                      \
    template <typename Stream>                                                           \
    void Serialize(Stream& s) const                                                      \
    {                                                                                    \
        SerializationOps(*this, s, CSerActionSerialize());                               \
    }                                                                                    \
    template <typename Stream>                                                           \
    void Unserialize(Stream& s)                                                          \
    {                                                                                    \
        SerializationOps(*this, s, CSerActionUnserialize());                             \
    }                                                                                    \
    template <typename Stream, typename Type, typename Operation>                        \
    static inline void SerializationOps(Type& obj, Stream& s, Operation ser_action)

#endif // CROWDFUND_SERIALIZE_H
