// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_STREAMS_H
#define ZSIGHASH_STREAMS_H

#include "serialize.h"

#include <algorithm>
#include <assert.h>
#include <stdint.h>
#include <string.h>
#include <vector>

/** Minimal stream for overwriting and/or appending to an existing byte vector
 *
 * The referenced vector will grow as necessary
 */
class CVectorWriter
{
public:
    /*
     * @param[in]  vchDataIn  Referenced byte vector to overwrite/append
     * @param[in]  nPosIn Starting position. Vector index where writes should start. The vector will initially
     *                    grow as necessary to max(nPosIn, vec.size()). So to append, use vec.size().
     */
    CVectorWriter(std::vector<unsigned char>& vchDataIn, size_t nPosIn) : vchData(vchDataIn), nPos(nPosIn)
    {
        if (nPos > vchData.size())
            vchData.resize(nPos);
    }

    /** Append to the end of vchDataIn. */
    explicit CVectorWriter(std::vector<unsigned char>& vchDataIn) : CVectorWriter(vchDataIn, vchDataIn.size()) {}

    void write(const char* pch, size_t nSize)
    {
        assert(nPos <= vchData.size());
        size_t nOverwrite = std::min(nSize, vchData.size() - nPos);
        if (nOverwrite) {
            memcpy(vchData.data() + nPos, reinterpret_cast<const unsigned char*>(pch), nOverwrite);
        }
        if (nOverwrite < nSize) {
            vchData.insert(vchData.end(), reinterpret_cast<const unsigned char*>(pch) + nOverwrite, reinterpret_cast<const unsigned char*>(pch) + nSize);
        }
        nPos += nSize;
    }

    template<typename T>
    CVectorWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }

private:
    std::vector<unsigned char>& vchData;
    size_t nPos;
};

#endif // ZSIGHASH_STREAMS_H
