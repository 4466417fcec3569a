#include <iostream>
#include "fengine_io_internals.hpp"

using namespace std;
using namespace fengine_io;


inline header_record make_header(bool valid, bool first, const string &dest, int chans, int n_chans)
{
    header_record h;
    h.valid = valid;
    h.first = first;
    h.dest = dest;
    h.chans = chans;
    h.n_chans = n_chans;
    h.is_8bit = (chans % 2) == 0;
    return h;
}

inline bool headers_equal(const vector<header_record> &a, const vector<header_record> &b)
{
    if (a.size() != b.size())
	return false;

    for (unsigned int i = 0; i < a.size(); i++) {
	if ((a[i].valid != b[i].valid) || (a[i].first != b[i].first) || (a[i].dest != b[i].dest))
	    return false;
	if ((a[i].chans != b[i].chans) || (a[i].n_chans != b[i].n_chans) || (a[i].is_8bit != b[i].is_8bit))
	    return false;
    }

    return true;
}


// A capture with four interfaces: two carrying data, one disabled, and one whose
// control register couldn't be read.
static header_capture make_capture(const string &antenna, const string &tuning, const string &hostname, bool with_bad_iface)
{
    header_capture c;
    c.antenna = antenna;
    c.tuning = tuning;
    c.hostname = hostname;
    c.nchan_tot = 4096;
    c.chan_bw = -0.25;
    c.sky_freq = 1420.0;

    c.eth_ctrl = { 0x3, 0x80000002, 0x1, 0x0 };
    c.eth_ctrl_ok = { 1, 1, 1, with_bad_iface ? (unsigned char)0 : (unsigned char)1 };

    c.headers[0] = {
	make_header(true, true, "10.17.1.1", 1024, 64),
	make_header(true, false, "10.17.1.1", 1024, 64),
	make_header(true, true, "10.17.1.1", 1088, 64),
	make_header(false, true, "10.17.1.9", 0, 0),
	make_header(true, true, "10.17.1.2", 2048, 64)
    };

    c.headers[1] = {
	make_header(true, true, "10.17.2.1", 1536, 64)
    };

    // Disabled interface with an empty header table (present in the file, but never read).
    c.headers[2] = { };

    return c;
}


static void test_capture_file_io()
{
    cerr << "test_capture_file_io()";

    const char *filename = "test_header_capture_file.h5";
    header_capture c = make_capture("1a", "b", "rfsoc1-ctrl-2", true);

    write_header_capture_file(filename, c);
    header_capture_file f(filename, false);

    if ((f.capture.antenna != "1a") || (f.capture.tuning != "b") || (f.get_hostname() != "rfsoc1-ctrl-2"))
	throw runtime_error("test_capture_file_io: identity didn't round-trip");
    if ((f.get_nchan_tot() != 4096) || (f.get_chan_bandwidth() != -0.25) || (f.capture.sky_freq != 1420.0))
	throw runtime_error("test_capture_file_io: calibration constants didn't round-trip");
    if ((f.get_ninterfaces() != 4) || (f.capture.eth_ctrl != c.eth_ctrl) || (f.capture.eth_ctrl_ok != c.eth_ctrl_ok))
	throw runtime_error("test_capture_file_io: eth_ctrl didn't round-trip");

    bool enabled = false;
    for (int iface = 0; iface < 3; iface++) {
	if (!f.read_interface_enabled(iface, enabled) || (enabled != (iface < 2)))
	    throw runtime_error("test_capture_file_io: wrong enabled flag for interface " + to_string(iface));
    }
    if (f.read_interface_enabled(3, enabled))
	throw runtime_error("test_capture_file_io: read_interface_enabled() should fail when eth_ctrl_ok is 0");

    vector<header_record> headers;
    for (int iface = 0; iface < 3; iface++) {
	if (!f.read_headers(iface, headers) || !headers_equal(headers, c.headers[iface]))
	    throw runtime_error("test_capture_file_io: header table " + to_string(iface) + " didn't round-trip");
    }

    if (f.read_headers(3, headers))
	throw runtime_error("test_capture_file_io: read_headers() should fail for interface with no captured headers");

    bool threw = false;
    try {
	f.read_headers(4, headers);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_capture_file_io: out-of-range interface should throw");

    f.disconnect();
    if (f.is_connected())
	throw runtime_error("test_capture_file_io: still connected after disconnect()");

    threw = false;
    try {
	f.read_interface_enabled(0, enabled);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_capture_file_io: query after disconnect() should throw");

    header_capture mismatched = c;
    mismatched.eth_ctrl_ok.pop_back();

    threw = false;
    try {
	write_header_capture_file(filename, mismatched);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_capture_file_io: eth_ctrl/eth_ctrl_ok length mismatch should throw");

    // Refuse to clobber.
    threw = false;
    try {
	write_header_capture_file(filename, c, false);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_capture_file_io: write with clobber=false should throw");

    cerr << "success\n";
}


static void test_capture_collation()
{
    cerr << "test_capture_collation()";

    write_header_capture_file("test_capture_1a.h5", make_capture("1a", "a", "rfsoc1-ctrl-1", false));
    write_header_capture_file("test_capture_2b.h5", make_capture("2b", "a", "rfsoc2-ctrl-1", true));

    unit_map units;
    units[antenna_tuning("1a","a")] = make_shared<header_capture_file> ("test_capture_1a.h5", false);
    units[antenna_tuning("2b","a")] = make_shared<header_capture_file> ("test_capture_2b.h5", false);

    collation_initializer ini_params;
    ini_params.noisy = false;
    ini_params.emit_warnings = false;

    collation_result result = collate_band_tables(units, { { "a", 1420.0 } }, ini_params);

    if ((result.band_tables.size() != 1) || !result.unavailable.count(antenna_tuning("2b","a")) || (result.failures.size() != 0))
	throw runtime_error("test_capture_collation: expected one band table and one unavailable unit");

    // Interface 1's subband lies between interface 0's two subbands.
    const band_table &t = result.band_tables.at(antenna_tuning("1a","a"));

    if (t.len() != 3)
	throw runtime_error("test_capture_collation: expected 3 bands, got " + to_string(t.len()));

    const int expected_start[3] = { 1024, 1536, 2048 };
    const int expected_stop[3] = { 1152, 1600, 2112 };
    const char *expected_address[3] = { "10.17.1.1", "10.17.2.1", "10.17.1.2" };

    for (int i = 0; i < 3; i++) {
	const frequency_band &b = t.bands[i];

	if ((b.index != i) || (b.channel_start != expected_start[i]) || (b.channel_stop != expected_stop[i]) || (b.address != expected_address[i]))
	    throw runtime_error("test_capture_collation: band " + to_string(i) + " is wrong");

	// Inverted spectrum: frequencies decrease with channel index.
	double f0 = 1420.0 + (expected_start[i] - 2048) * (-0.25);
	double f1 = 1420.0 + (expected_stop[i] - 2048) * (-0.25);
	if ((fabs(b.frequency_start - f0) > 1.0e-9) || (fabs(b.frequency_stop - f1) > 1.0e-9) || (b.frequency_start <= b.frequency_stop))
	    throw runtime_error("test_capture_collation: band " + to_string(i) + " has wrong frequencies");
    }

    for (const auto &kv: units) {
	const header_capture_file *f = dynamic_cast<const header_capture_file *> (kv.second.get());
	if (f->is_connected())
	    throw runtime_error("test_capture_collation: " + f->filename + " still connected after collation");
    }

    cerr << "success\n";
}


// Register values with bit 31 set are ordinary register contents, not failed queries.
static void test_high_bit_registers()
{
    cerr << "test_high_bit_registers()";

    header_capture c;
    c.antenna = "5e";
    c.tuning = "a";
    c.hostname = "rfsoc5-ctrl-1";
    c.nchan_tot = 1024;
    c.chan_bw = 1.0;
    c.sky_freq = 1000.0;
    c.eth_ctrl = { 0x80000002, 0xfffffffd, 0xffffffff };
    c.eth_ctrl_ok = { 1, 1, 1 };
    c.headers[0] = { make_header(true, true, "10.5.0.1", 0, 256) };
    c.headers[2] = { make_header(true, true, "10.5.0.3", 512, 256) };

    write_header_capture_file("test_capture_5e.h5", c);
    auto f = make_shared<header_capture_file> ("test_capture_5e.h5", false);

    if (f->capture.eth_ctrl != c.eth_ctrl)
	throw runtime_error("test_high_bit_registers: 32-bit register values didn't round-trip");

    bool enabled = false;
    if (!f->read_interface_enabled(0, enabled) || !enabled)
	throw runtime_error("test_high_bit_registers: 0x80000002 should read as enabled");
    if (!f->read_interface_enabled(1, enabled) || enabled)
	throw runtime_error("test_high_bit_registers: 0xfffffffd should read as disabled");
    if (!f->read_interface_enabled(2, enabled) || !enabled)
	throw runtime_error("test_high_bit_registers: 0xffffffff should read as enabled");

    unit_map units;
    units[antenna_tuning("5e","a")] = f;

    collation_initializer ini_params;
    ini_params.noisy = false;
    ini_params.emit_warnings = false;

    collation_result result = collate_band_tables(units, { { "a", 1000.0 } }, ini_params);

    if ((result.unavailable.size() != 0) || (result.band_tables.size() != 1))
	throw runtime_error("test_high_bit_registers: unit with high-bit registers should collate");

    const band_table &t = result.band_tables.at(antenna_tuning("5e","a"));
    if ((t.len() != 2) || (t.bands[0].address != "10.5.0.1") || (t.bands[1].channel_start != 512) || (t.bands[1].channel_stop != 768))
	throw runtime_error("test_high_bit_registers: wrong band table");

    cerr << "success\n";
}


static collation_result make_result()
{
    collation_result r;

    band_table t;
    t.pair = antenna_tuning("1a", "a");

    frequency_band b;
    b.index = 0;
    b.channel_start = 0;
    b.channel_stop = 1024;
    b.address = "10.0.0.1";
    b.frequency_start = 488.0;
    b.frequency_stop = 1512.0;
    t.bands.push_back(b);

    b.index = 1;
    b.channel_start = 1024;
    b.channel_stop = 1536;
    b.address = "10.0.0.2";
    b.frequency_start = 1512.0;
    b.frequency_stop = 2024.0;
    t.bands.push_back(b);

    r.band_tables[t.pair] = t;

    band_table empty;
    empty.pair = antenna_tuning("1a", "b");
    r.band_tables[empty.pair] = empty;

    r.unavailable[antenna_tuning("2b", "a")] = "failed to query rfsoc2-ctrl-1";
    r.failures[antenna_tuning("3c", "d")] = "Read headers from rfsoc3-ctrl-4 that indicate non-integer number of streams: 10 / 4 = 2.5";

    return r;
}


static void test_collation_result_msgpack()
{
    cerr << "test_collation_result_msgpack()";

    const char *filename = "test_collation_result.msgpack";
    collation_result r = make_result();

    r.write_msgpack_file(filename);
    collation_result r2 = collation_result::read_msgpack_file(filename);

    if ((r2.band_tables.size() != 2) || (r2.unavailable != r.unavailable) || (r2.failures != r.failures))
	throw runtime_error("test_collation_result_msgpack: collation_result didn't round-trip");

    const band_table &t = r.band_tables.at(antenna_tuning("1a","a"));
    const band_table &t2 = r2.band_tables.at(antenna_tuning("1a","a"));

    if ((t2.len() != 2) || (r2.band_tables.at(antenna_tuning("1a","b")).len() != 0))
	throw runtime_error("test_collation_result_msgpack: band tables have wrong length");

    for (int i = 0; i < t.len(); i++) {
	const frequency_band &a = t.bands[i];
	const frequency_band &b = t2.bands[i];
	if ((a.index != b.index) || (a.channel_start != b.channel_start) || (a.channel_stop != b.channel_stop) || (a.address != b.address)
	    || (a.frequency_start != b.frequency_start) || (a.frequency_stop != b.frequency_stop))
	    throw runtime_error("test_collation_result_msgpack: band " + to_string(i) + " didn't round-trip");
    }

    bool threw = false;
    try {
	collation_result::read_msgpack_file("/nonexistent/collation_result.msgpack");
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_collation_result_msgpack: missing file should throw");

    cerr << "success\n";
}


static void test_flatten_band_tables()
{
    cerr << "test_flatten_band_tables()";

    vector<metadata_value> kv = flatten_band_tables(make_result());

    // 1a/a: len + 2 bands * 5 fields, 1a/b: len only.  Unavailable and failed pairs are omitted.
    if (kv.size() != 12)
	throw runtime_error("test_flatten_band_tables: expected 12 keys, got " + to_string(kv.size()));

    map<string, const metadata_value *> m;
    for (const metadata_value &v: kv)
	m[v.key] = &v;

    const string prefix = "observatory.antenna.1a.tunings.a.bands.";

    if (!m.count(prefix + "len") || (m[prefix + "len"]->value_str() != "2") || (string(m[prefix + "len"]->type_name()) != "u64"))
	throw runtime_error("test_flatten_band_tables: bad len key");
    if (!m.count("observatory.antenna.1a.tunings.b.bands.len") || (m["observatory.antenna.1a.tunings.b.bands.len"]->i != 0))
	throw runtime_error("test_flatten_band_tables: empty band table should still have a len key");

    const metadata_value *addr = m.count(prefix + "1.address") ? m[prefix + "1.address"] : nullptr;
    if (!addr || (addr->type != metadata_value::type_string) || (addr->s != "10.0.0.2"))
	throw runtime_error("test_flatten_band_tables: bad address key");

    const metadata_value *fstop = m.count(prefix + "0.frequency_stop") ? m[prefix + "0.frequency_stop"] : nullptr;
    if (!fstop || (fstop->type != metadata_value::type_f64) || (fstop->f != 1512.0))
	throw runtime_error("test_flatten_band_tables: bad frequency_stop key");

    const metadata_value *cstart = m.count(prefix + "1.channel_start") ? m[prefix + "1.channel_start"] : nullptr;
    if (!cstart || (cstart->type != metadata_value::type_u64) || (cstart->i != 1024))
	throw runtime_error("test_flatten_band_tables: bad channel_start key");

    for (const metadata_value &v: kv) {
	if (v.key.find("2b") != string::npos || v.key.find("3c") != string::npos)
	    throw runtime_error("test_flatten_band_tables: unexpected key " + v.key);
    }

    cerr << "success\n";
}


// -------------------------------------------------------------------------------------------------


int main(int argc, char **argv)
{
    test_capture_file_io();
    test_capture_collation();
    test_high_bit_registers();
    test_collation_result_msgpack();
    test_flatten_band_tables();

    return 0;
}
