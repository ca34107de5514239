#ifndef SPARKBRIDGE_SERDE_HPP
#define SPARKBRIDGE_SERDE_HPP

#include <cstddef>
#include <tuple>
#include <vector>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/utility.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/binary_iarchive.hpp>

// stage arguments travel as a tuple
namespace boost {
    namespace serialization {

        template <class Archive, typename... Args>
        void serialize(Archive& ar, std::tuple<Args...>& t, const unsigned int) {
            std::apply([&](auto&... elems) {
                (ar & ... & elems);
            }, t);
        }

    }
}

constexpr unsigned int archiveFlags = boost::archive::no_header | boost::archive::no_tracking;

/// Appends `v` to `bytes` as a headerless binary archive.
template <typename T>
void serialize(const T& v, std::vector<char>& bytes) {
    boost::iostreams::stream<boost::iostreams::back_insert_device<std::vector<char>>> s{bytes};
    {
        boost::archive::binary_oarchive oa{s, archiveFlags};
        oa << v;
    }
    s.flush();
}

template <typename T>
void deserialize(T& v, const char* bytes, std::size_t size) {
    boost::iostreams::stream<boost::iostreams::basic_array_source<char>> s{bytes, size};
    boost::archive::binary_iarchive ia{s, archiveFlags};
    ia >> v;
}

#endif //SPARKBRIDGE_SERDE_HPP
