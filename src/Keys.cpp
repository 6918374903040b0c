#include "Keys.hpp"

const z_crc_t* const Keys::crcTable = get_crc_table();

Keys::Keys(const std::string& password)
{
    for (const auto p : password)
        update(p);
}
