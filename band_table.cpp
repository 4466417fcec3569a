#include <cstdio>
#include <iomanip>
#include <msgpack/fbuffer.hpp>
#include "band_table_msgpack.hpp"
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


void collation_result::write_msgpack_file(const string &filename) const
{
    FILE* f = fopen(filename.c_str(), "w+");
    if (!f)
        throw runtime_error("fengine_io: failed to open file " + filename + " for writing a collation_result in msgpack format: " + strerror(errno));

    // msgpack buffer that will write to file "f"
    msgpack::fbuffer buffer(f);

    try {
	msgpack::pack(buffer, *this);
    } catch (...) {
	fclose(f);
	throw;
    }

    if (fclose(f))
        throw runtime_error("fengine_io: failed to close collation_result msgpack file " + filename + ": " + string(strerror(errno)));
}


collation_result collation_result::read_msgpack_file(const string &filename)
{
    struct stat st;
    if (stat(filename.c_str(), &st))
        throw runtime_error("fengine_io: failed to stat file " + filename + " for reading a collation_result in msgpack format: " + strerror(errno));

    size_t len = st.st_size;
    FILE* f = fopen(filename.c_str(), "r");
    if (!f)
        throw runtime_error("fengine_io: failed to open file " + filename + " for reading a collation_result in msgpack format: " + strerror(errno));

    vector<char> fdata(len);
    size_t nr = (len > 0) ? fread(&fdata[0], 1, len, f) : 0;
    fclose(f);

    if (nr != len)
        throw runtime_error("fengine_io: failed to read " + to_string(len) + " bytes from file " + filename + " for reading a collation_result in msgpack format");
    if (len == 0)
        throw runtime_error("fengine_io: collation_result msgpack file " + filename + " is empty");

    msgpack::object_handle oh = msgpack::unpack(&fdata[0], len);
    msgpack::object obj = oh.get();

    collation_result ret;
    obj.convert(ret);
    return ret;
}


// -------------------------------------------------------------------------------------------------
//
// Metadata flattening


metadata_value metadata_value::make_string(const string &key, const string &s)
{
    metadata_value ret;
    ret.key = key;
    ret.type = type_string;
    ret.s = s;
    return ret;
}

metadata_value metadata_value::make_bool(const string &key, bool b)
{
    metadata_value ret;
    ret.key = key;
    ret.type = type_u32;
    ret.i = b ? 1 : 0;
    return ret;
}

metadata_value metadata_value::make_int(const string &key, int64_t i)
{
    metadata_value ret;
    ret.key = key;
    ret.type = (i < 0) ? type_i64 : type_u64;
    ret.i = i;
    return ret;
}

metadata_value metadata_value::make_float(const string &key, double f)
{
    metadata_value ret;
    ret.key = key;
    ret.type = type_f64;
    ret.f = f;
    return ret;
}


const char *metadata_value::type_name() const
{
    switch (type) {
    case type_string: return "string";
    case type_u32: return "u32";
    case type_i64: return "i64";
    case type_u64: return "u64";
    case type_f64: return "f64";
    }

    throw runtime_error("fengine_io: internal error: bad metadata_value::type " + to_string((int)type));
}


std::string metadata_value::value_str() const
{
    if (type == type_string)
	return s;
    if (type == type_f64) {
	// max_digits10 for double, so that the value round-trips through the string
	stringstream ss;
	ss << setprecision(17) << f;
	return ss.str();
    }
    return to_string(i);
}


vector<metadata_value> flatten_band_tables(const collation_result &result)
{
    vector<metadata_value> ret;

    for (const auto &kv: result.band_tables) {
	const band_table &t = kv.second;
	string base = string(constants::metadata_key_prefix) + "." + t.pair.antenna + ".tunings." + t.pair.tuning + ".bands";

	ret.push_back(metadata_value::make_int(base + ".len", t.len()));

	for (const frequency_band &b: t.bands) {
	    string path = base + "." + to_string(b.index);
	    ret.push_back(metadata_value::make_int(path + ".channel_start", b.channel_start));
	    ret.push_back(metadata_value::make_int(path + ".channel_stop", b.channel_stop));
	    ret.push_back(metadata_value::make_string(path + ".address", b.address));
	    ret.push_back(metadata_value::make_float(path + ".frequency_start", b.frequency_start));
	    ret.push_back(metadata_value::make_float(path + ".frequency_stop", b.frequency_stop));
	}
    }

    return ret;
}


}  // namespace fengine_io
