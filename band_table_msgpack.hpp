#ifndef _BAND_TABLE_MSGPACK_HPP
#define _BAND_TABLE_MSGPACK_HPP

#include <map>
#include <string>
#include <vector>

#include <msgpack.hpp>

#include "fengine_io.hpp"


/** Code for packing collation results into msgpack messages, and vice versa. **/

namespace msgpack {
MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
namespace adaptor {


// frequency_band <-> [ index, channel_start, channel_stop, address, frequency_start, frequency_stop ]

template<>
struct convert<fengine_io::frequency_band> {
    msgpack::object const& operator()(msgpack::object const& o, fengine_io::frequency_band& b) const {
        if (o.type != msgpack::type::ARRAY) throw msgpack::type_error();
        if (o.via.array.size != 6) throw msgpack::type_error();
        msgpack::object* arr = o.via.array.ptr;

        b.index           = arr[0].as<int>();
        b.channel_start   = arr[1].as<int>();
        b.channel_stop    = arr[2].as<int>();
        b.address         = arr[3].as<std::string>();
        b.frequency_start = arr[4].as<double>();
        b.frequency_stop  = arr[5].as<double>();
        return o;
    }
};

template<>
struct pack<fengine_io::frequency_band> {
    template <typename Stream>
    packer<Stream>& operator()(msgpack::packer<Stream>& o, fengine_io::frequency_band const& b) const {
        o.pack_array(6);
        o.pack(b.index);
        o.pack(b.channel_start);
        o.pack(b.channel_stop);
        o.pack(b.address);
        o.pack_double(b.frequency_start);
        o.pack_double(b.frequency_stop);
        return o;
    }
};


// band_table <-> [ antenna, tuning, len, [ bands... ] ]

template<>
struct convert<fengine_io::band_table> {
    msgpack::object const& operator()(msgpack::object const& o, fengine_io::band_table& t) const {
        if (o.type != msgpack::type::ARRAY) throw msgpack::type_error();
        if (o.via.array.size != 4) throw msgpack::type_error();
        msgpack::object* arr = o.via.array.ptr;

        t.pair.antenna = arr[0].as<std::string>();
        t.pair.tuning  = arr[1].as<std::string>();
        int len        = arr[2].as<int>();
        t.bands        = arr[3].as<std::vector<fengine_io::frequency_band> >();

        if (len != t.len())
            throw std::runtime_error("fengine_io: band_table msgpack len=" + std::to_string(len) + " doesn't match number of bands (" + std::to_string(t.len()) + ")");
        return o;
    }
};

template<>
struct pack<fengine_io::band_table> {
    template <typename Stream>
    packer<Stream>& operator()(msgpack::packer<Stream>& o, fengine_io::band_table const& t) const {
        o.pack_array(4);
        o.pack(t.pair.antenna);
        o.pack(t.pair.tuning);
        o.pack(t.len());
        o.pack(t.bands);
        return o;
    }
};


//
// collation_result <-> [ header, version, [ band_tables... ], [ unavailable... ], [ failures... ] ]
//
// where each element of 'unavailable' and 'failures' is a triple [ antenna, tuning, message ].
//

template<>
struct convert<fengine_io::collation_result> {
    static void _convert_markers(msgpack::object const& o, std::map<fengine_io::antenna_tuning, std::string> &m) {
        if (o.type != msgpack::type::ARRAY) throw msgpack::type_error();
        for (uint32_t i = 0; i < o.via.array.size; i++) {
            msgpack::object const& e = o.via.array.ptr[i];
            if (e.type != msgpack::type::ARRAY) throw msgpack::type_error();
            if (e.via.array.size != 3) throw msgpack::type_error();
            fengine_io::antenna_tuning pair(e.via.array.ptr[0].as<std::string>(), e.via.array.ptr[1].as<std::string>());
            m[pair] = e.via.array.ptr[2].as<std::string>();
        }
    }

    msgpack::object const& operator()(msgpack::object const& o, fengine_io::collation_result& r) const {
        if (o.type != msgpack::type::ARRAY) throw msgpack::type_error();
        if (o.via.array.size != 5) throw msgpack::type_error();
        msgpack::object* arr = o.via.array.ptr;

        std::string header = arr[0].as<std::string>();
        int version        = arr[1].as<int>();
        if (version != fengine_io::constants::collation_result_msgpack_version)
            throw std::runtime_error("fengine_io: collation_result msgpack version " + std::to_string(version) + ", expected "
                                     + std::to_string(fengine_io::constants::collation_result_msgpack_version));

        std::vector<fengine_io::band_table> tables = arr[2].as<std::vector<fengine_io::band_table> >();

        r = fengine_io::collation_result();
        for (const fengine_io::band_table &t: tables)
            r.band_tables[t.pair] = t;

        _convert_markers(arr[3], r.unavailable);
        _convert_markers(arr[4], r.failures);
        return o;
    }
};

template<>
struct pack<fengine_io::collation_result> {
    template <typename Stream>
    static void _pack_markers(msgpack::packer<Stream>& o, std::map<fengine_io::antenna_tuning, std::string> const& m) {
        o.pack_array(m.size());
        for (const auto &kv: m) {
            o.pack_array(3);
            o.pack(kv.first.antenna);
            o.pack(kv.first.tuning);
            o.pack(kv.second);
        }
    }

    template <typename Stream>
    packer<Stream>& operator()(msgpack::packer<Stream>& o, fengine_io::collation_result const& r) const {
        int version = fengine_io::constants::collation_result_msgpack_version;
        o.pack_array(5);
        o.pack("collation_result in msgpack format");
        o.pack(version);

        o.pack_array(r.band_tables.size());
        for (const auto &kv: r.band_tables)
            o.pack(kv.second);

        _pack_markers(o, r.unavailable);
        _pack_markers(o, r.failures);
        return o;
    }
};


} // namespace adaptor
} // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
} // namespace msgpack

#endif // _BAND_TABLE_MSGPACK_HPP
