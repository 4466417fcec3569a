#include <algorithm>
#include "fengine_io_internals.hpp"

using namespace std;
using namespace fengine_io;


inline header_record make_header(bool valid, bool first, const string &dest, int chans, int n_chans, bool is_8bit=true)
{
    header_record h;
    h.valid = valid;
    h.first = first;
    h.dest = dest;
    h.chans = chans;
    h.n_chans = n_chans;
    h.is_8bit = is_8bit;
    return h;
}

inline void check_subband(const channel_subband &s, const string &dest, int start, int stop, int nstreams)
{
    if ((s.dest != dest) || (s.start != start) || (s.stop != stop) || (s.nstreams != nstreams)) {
	stringstream ss;
	ss << "subband mismatch: got {" << s.dest << ", " << s.start << ", " << s.stop << ", " << s.nstreams << "}"
	   << ", expected {" << dest << ", " << start << ", " << stop << ", " << nstreams << "}";
	throw runtime_error(ss.str());
    }
}

inline vector<channel_subband> finalize_all(const vector<stream_segment> &segments)
{
    vector<channel_subband> ret;
    for (const stream_segment &s: segments)
	ret.push_back(finalize_stream_segment(s, "test-host"));
    return ret;
}


// -------------------------------------------------------------------------------------------------
//
// test_unit: an in-memory fengine_unit with switchable failure modes.


struct test_unit : public fengine_unit {
    string hostname;
    vector<bool> enabled;
    map<int, vector<header_record> > headers;   // missing entry -> read_headers() fails
    int fail_enable_query = -1;                 // interface whose control register can't be read
    int throw_on_headers = -1;                  // interface whose header read throws runtime_error
    int nchan_tot = 1024;
    double chan_bw = 1.0;

    int ndisconnect = 0;
    bool connected = true;

    test_unit(const string &hostname_, int ninterfaces) : hostname(hostname_), enabled(ninterfaces, true) { }

    virtual string get_hostname() const override { return hostname; }
    virtual int get_ninterfaces() const override { return enabled.size(); }

    virtual bool read_interface_enabled(int iface, bool &e) override
    {
	if (!connected)
	    throw runtime_error("test_unit: read_interface_enabled() called after disconnect()");
	if (iface == fail_enable_query)
	    return false;
	e = enabled[iface];
	return true;
    }

    virtual bool read_headers(int iface, vector<header_record> &h) override
    {
	if (!connected)
	    throw runtime_error("test_unit: read_headers() called after disconnect()");
	if (iface == throw_on_headers)
	    throw runtime_error(hostname + ": connection reset while reading headers");
	auto p = headers.find(iface);
	if (p == headers.end())
	    return false;
	h = p->second;
	return true;
    }

    virtual int get_nchan_tot() const override { return nchan_tot; }
    virtual double get_chan_bandwidth() const override { return chan_bw; }

    virtual void disconnect() noexcept override
    {
	ndisconnect++;
	connected = false;
    }
};


// -------------------------------------------------------------------------------------------------


static void test_merge_scenario()
{
    cerr << "test_merge_scenario()";

    vector<header_record> headers = {
	make_header(true, true, "10.0.0.1", 0, 8),
	make_header(true, true, "10.0.0.1", 8, 8),
	make_header(true, true, "10.0.0.2", 16, 8)
    };

    vector<channel_subband> subbands = finalize_all(merge_packet_streams(headers));

    if (subbands.size() != 2)
	throw runtime_error("test_merge_scenario: expected 2 subbands, got " + to_string(subbands.size()));

    check_subband(subbands[0], "10.0.0.1", 0, 16, 2);
    check_subband(subbands[1], "10.0.0.2", 16, 24, 1);

    cerr << "success\n";
}


static void test_merge_ignores_non_first_headers()
{
    cerr << "test_merge_ignores_non_first_headers()";

    // Only (valid && first) headers carry boundary information.  Note that the invalid header in
    // the middle has a different address, but doesn't close the open segment.
    vector<header_record> headers = {
	make_header(true, false, "10.0.0.9", 0, 4),
	make_header(true, true, "10.0.0.1", 4, 4),
	make_header(false, true, "10.0.0.7", 8, 4),
	make_header(true, false, "10.0.0.1", 8, 4),
	make_header(true, true, "10.0.0.1", 12, 4),
	make_header(false, false, "10.0.0.3", 16, 4)
    };

    vector<stream_segment> segments = merge_packet_streams(headers);

    if (segments.size() != 1)
	throw runtime_error("test_merge_ignores_non_first_headers: expected 1 segment");
    if ((segments[0].start_chan != 4) || (segments[0].end_chan != 12) || (segments[0].packet_nchan != 4))
	throw runtime_error("test_merge_ignores_non_first_headers: bad segment boundaries");

    check_subband(finalize_stream_segment(segments[0], "test-host"), "10.0.0.1", 4, 16, 3);

    // An interface with no (valid && first) headers is idle, not an error.
    vector<header_record> idle = { make_header(false, true, "10.0.0.1", 0, 4), make_header(true, false, "10.0.0.1", 4, 4) };

    if (merge_packet_streams(idle).size() != 0)
	throw runtime_error("test_merge_ignores_non_first_headers: idle interface produced a segment");
    if (merge_packet_streams(vector<header_record>()).size() != 0)
	throw runtime_error("test_merge_ignores_non_first_headers: empty header table produced a segment");

    cerr << "success\n";
}


// Non-adjacent runs sharing an address merge into one segment, since the merge test only
// compares addresses.
static void test_merge_nonadjacent_same_address()
{
    cerr << "test_merge_nonadjacent_same_address()";

    vector<header_record> headers = {
	make_header(true, true, "10.0.0.1", 0, 8),
	make_header(true, true, "10.0.0.1", 64, 8)
    };

    vector<stream_segment> segments = merge_packet_streams(headers);

    if (segments.size() != 1)
	throw runtime_error("test_merge_nonadjacent_same_address: expected a single merged segment");

    check_subband(finalize_stream_segment(segments[0], "test-host"), "10.0.0.1", 0, 72, 9);

    // Same address, but the second run has a different packet size.  The segment keeps the
    // packet size of the opening header.
    vector<header_record> headers2 = {
	make_header(true, true, "10.0.0.1", 0, 4),
	make_header(true, true, "10.0.0.1", 4, 6)
    };

    segments = merge_packet_streams(headers2);

    if ((segments.size() != 1) || (segments[0].packet_nchan != 4) || (segments[0].end_chan != 4))
	throw runtime_error("test_merge_nonadjacent_same_address: packet size of opening header not kept");

    cerr << "success\n";
}


static void test_finalizer_rejects_partial_stream()
{
    cerr << "test_finalizer_rejects_partial_stream()";

    stream_segment s;
    s.dest = "10.0.0.1";
    s.start_chan = 0;
    s.end_chan = 6;
    s.packet_nchan = 4;

    try {
	finalize_stream_segment(s, "rfsoc1-ctrl-1");
    } catch (collation_error &e) {
	if ((e.hostname != "rfsoc1-ctrl-1") || (e.nchans != 10) || (e.packet_nchan != 4) || (e.nstreams != 2.5))
	    throw runtime_error("test_finalizer_rejects_partial_stream: bad collation_error fields");

	string msg = e.what();
	if (msg.find("rfsoc1-ctrl-1") == string::npos || msg.find("10 / 4 = 2.5") == string::npos)
	    throw runtime_error("test_finalizer_rejects_partial_stream: unexpected message '" + msg + "'");

	cerr << "success\n";
	return;
    }

    throw runtime_error("test_finalizer_rejects_partial_stream: expected collation_error");
}


static void test_finalizer_integer_streams(std::mt19937 &rng)
{
    cerr << "test_finalizer_integer_streams()";

    int nthrown = 0;

    for (int iter = 0; iter < 10000; iter++) {
	stream_segment s;
	s.dest = "10.0.0.1";
	s.start_chan = randint(rng, 0, 4096);
	s.end_chan = s.start_chan + randint(rng, 0, 256);
	s.packet_nchan = randint(rng, 1, 17);

	int n = s.packet_nchan;
	bool expect_throw = ((s.end_chan + n - s.start_chan) % n) != 0;
	bool threw = false;
	channel_subband sb;

	try {
	    sb = finalize_stream_segment(s, "test-host");
	} catch (collation_error &e) {
	    threw = true;
	}

	if (threw != expect_throw)
	    throw runtime_error("test_finalizer_integer_streams: collation_error thrown=" + to_string(threw) + ", expected " + to_string(expect_throw));

	if (threw) {
	    nthrown++;
	    continue;
	}

	if ((sb.start != s.start_chan) || (sb.stop != s.end_chan + n) || (sb.stop <= sb.start))
	    throw runtime_error("test_finalizer_integer_streams: bad subband boundaries");
	if (sb.nstreams * n != sb.stop - sb.start)
	    throw runtime_error("test_finalizer_integer_streams: nstreams is not (stop-start)/packet_nchan");
    }

    // With packet_nchan up to 16, roughly half of the random segments should be rejected.
    if ((nthrown == 0) || (nthrown == 10000))
	throw runtime_error("test_finalizer_integer_streams: expected a mix of accepted and rejected segments, got " + to_string(nthrown) + " rejected");

    stream_segment s;
    s.packet_nchan = 0;

    bool threw = false;
    try {
	finalize_stream_segment(s, "test-host");
    } catch (collation_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_finalizer_integer_streams: packet_nchan=0 should throw");

    cerr << "success\n";
}


//
// Random header tables made of runs with alternating addresses, interleaved with headers that
// should be ignored.  Checks that the channels are conserved, that each run becomes one subband,
// and that merging is deterministic.
//
static void test_channel_conservation(std::mt19937 &rng)
{
    cerr << "test_channel_conservation()";

    for (int iouter = 0; iouter < 1000; iouter++) {
	int nruns = randint(rng, 0, 10);
	int chan = randint(rng, 0, 64);

	vector<header_record> headers;
	vector<channel_subband> expected;
	int first_header_nchans = 0;

	for (int irun = 0; irun < nruns; irun++) {
	    // Consecutive runs need distinct addresses, otherwise they'd merge.
	    string dest = "10.0." + to_string(irun % 2) + "." + to_string(randint(rng, 1, 255));
	    int n = 1 << randint(rng, 0, 5);
	    int npackets = randint(rng, 1, 9);

	    channel_subband sb;
	    sb.dest = dest;
	    sb.start = chan;
	    sb.stop = chan + n * npackets;
	    sb.nstreams = npackets;
	    expected.push_back(sb);

	    for (int ipacket = 0; ipacket < npackets; ipacket++) {
		headers.push_back(make_header(true, true, dest, chan, n));
		first_header_nchans += n;

		if (uniform_rand(rng) < 0.3)
		    headers.push_back(make_header(false, true, "10.1.1.1", chan, n+1));
		if (uniform_rand(rng) < 0.3)
		    headers.push_back(make_header(true, false, "10.1.1.2", chan, n+2));

		chan += n;
	    }
	}

	vector<stream_segment> segments = merge_packet_streams(headers);
	vector<stream_segment> segments2 = merge_packet_streams(headers);

	if (segments.size() != segments2.size())
	    throw runtime_error("test_channel_conservation: merge_packet_streams() isn't deterministic");

	for (unsigned int i = 0; i < segments.size(); i++) {
	    const stream_segment &a = segments[i];
	    const stream_segment &b = segments2[i];
	    if ((a.dest != b.dest) || (a.start_chan != b.start_chan) || (a.end_chan != b.end_chan) || (a.packet_nchan != b.packet_nchan) || (a.is_8bit != b.is_8bit))
		throw runtime_error("test_channel_conservation: merge_packet_streams() isn't deterministic");
	}

	vector<channel_subband> subbands = finalize_all(segments);

	if (subbands.size() != expected.size())
	    throw runtime_error("test_channel_conservation: expected " + to_string(expected.size()) + " subbands, got " + to_string(subbands.size()));

	int nchans = 0;
	for (unsigned int i = 0; i < subbands.size(); i++) {
	    check_subband(subbands[i], expected[i].dest, expected[i].start, expected[i].stop, expected[i].nstreams);
	    nchans += subbands[i].stop - subbands[i].start;

	    if ((i > 0) && (subbands[i].start < subbands[i-1].stop))
		throw runtime_error("test_channel_conservation: subbands overlap");
	}

	if (nchans != first_header_nchans)
	    throw runtime_error("test_channel_conservation: channel count not conserved");
    }

    cerr << "success\n";
}


// -------------------------------------------------------------------------------------------------


static void test_frequency_scenario()
{
    cerr << "test_frequency_scenario()";

    channel_subband s;
    s.dest = "10.0.0.1";
    s.start = 0;
    s.stop = 1024;
    s.nstreams = 1;

    vector<frequency_band> bands = map_frequency_bands({ s }, 1024, 1.0, 1000.0);

    if (bands.size() != 1)
	throw runtime_error("test_frequency_scenario: expected 1 band, got " + to_string(bands.size()));
    if ((bands[0].frequency_start != 488.0) || (bands[0].frequency_stop != 1512.0))
	throw runtime_error("test_frequency_scenario: expected [488,1512], got [" + to_string(bands[0].frequency_start) + "," + to_string(bands[0].frequency_stop) + "]");
    if ((bands[0].index != 0) || (bands[0].channel_start != 0) || (bands[0].channel_stop != 1024) || (bands[0].address != "10.0.0.1"))
	throw runtime_error("test_frequency_scenario: band fields not copied from subband");

    // Two halves of the same band, with an odd channel count (so center_chan is not an integer).
    channel_subband lo, hi;
    lo.dest = "10.0.0.1";
    lo.start = 0;
    lo.stop = 8;
    hi.dest = "10.0.0.2";
    hi.start = 8;
    hi.stop = 15;

    bands = map_frequency_bands({ lo, hi }, 15, 0.5, 100.0);

    if ((bands.size() != 2) || (bands[0].index != 0) || (bands[1].index != 1))
	throw runtime_error("test_frequency_scenario: expected 2 bands indexed 0,1");

    // channel i spans [ sky_freq + (i - 7.5) * 0.5, sky_freq + (i - 6.5) * 0.5 ]
    if ((fabs(bands[0].frequency_start - 96.25) > 1.0e-12) || (fabs(bands[0].frequency_stop - 100.25) > 1.0e-12))
	throw runtime_error("test_frequency_scenario: lower band has wrong edges");
    if ((fabs(bands[1].frequency_start - 100.25) > 1.0e-12) || (fabs(bands[1].frequency_stop - 103.75) > 1.0e-12))
	throw runtime_error("test_frequency_scenario: upper band has wrong edges");

    cerr << "success\n";
}


static void test_frequency_symmetry(std::mt19937 &rng)
{
    cerr << "test_frequency_symmetry()";

    for (int iter = 0; iter < 1000; iter++) {
	int nchan_tot = 2 * randint(rng, 1, 4097);
	double chan_bw = uniform_rand(rng, 0.01, 1.0) * ((uniform_rand(rng) < 0.5) ? -1.0 : 1.0);
	double sky_freq = uniform_rand(rng, 1000.0, 10000.0);

	channel_subband s;
	s.start = 0;
	s.stop = nchan_tot;

	vector<frequency_band> bands = map_frequency_bands({ s }, nchan_tot, chan_bw, sky_freq);

	double mid = (bands[0].frequency_start + bands[0].frequency_stop) / 2.0;
	double halfwidth = (bands[0].frequency_stop - bands[0].frequency_start) / 2.0;

	if (fabs(mid - sky_freq) > 1.0e-9 * sky_freq)
	    throw runtime_error("test_frequency_symmetry: full band is not centered on the sky frequency");
	if (fabs(halfwidth - chan_bw * nchan_tot / 2.0) > 1.0e-9 * fabs(chan_bw * nchan_tot))
	    throw runtime_error("test_frequency_symmetry: full band has wrong width");

	// For an inverted spectrum, the band edges come out in descending order.
	if ((chan_bw < 0.0) != (bands[0].frequency_start > bands[0].frequency_stop))
	    throw runtime_error("test_frequency_symmetry: band edges have wrong ordering for sign of chan_bw");
    }

    if (map_frequency_bands(vector<channel_subband>(), 1024, 1.0, 1000.0).size() != 0)
	throw runtime_error("test_frequency_symmetry: no subbands should give no bands");

    cerr << "success\n";
}


// -------------------------------------------------------------------------------------------------


static void test_read_channel_subbands()
{
    cerr << "test_read_channel_subbands()";

    vector<channel_subband> subbands;

    // All interfaces disabled: empty contribution, not an error.
    test_unit u0("host0", 2);
    u0.enabled = { false, false };
    if (!read_channel_subbands(u0, subbands, false) || (subbands.size() != 0))
	throw runtime_error("test_read_channel_subbands: all-disabled unit should give an empty subband list");

    // A disabled interface is never read, even if reading it would fail.
    test_unit u1("host1", 2);
    u1.enabled = { false, true };
    u1.headers[1] = { make_header(true, true, "10.0.0.5", 32, 16) };
    if (!read_channel_subbands(u1, subbands, false) || (subbands.size() != 1))
	throw runtime_error("test_read_channel_subbands: expected one subband from the enabled interface");
    check_subband(subbands[0], "10.0.0.5", 32, 48, 1);

    // Failure to read any control register makes the whole unit unavailable,
    // even if the failing interface would have been disabled.
    test_unit u2("host2", 3);
    u2.headers[0] = { make_header(true, true, "10.0.0.1", 0, 16) };
    u2.headers[1] = { make_header(true, true, "10.0.0.2", 16, 16) };
    u2.headers[2] = { make_header(true, true, "10.0.0.3", 32, 16) };
    u2.fail_enable_query = 2;
    if (read_channel_subbands(u2, subbands, false))
	throw runtime_error("test_read_channel_subbands: expected failure when a control register can't be read");

    // Failure to read headers from an enabled interface also makes the unit unavailable.
    test_unit u3("host3", 2);
    u3.headers[0] = { make_header(true, true, "10.0.0.1", 0, 16) };
    if (read_channel_subbands(u3, subbands, false))
	throw runtime_error("test_read_channel_subbands: expected failure when headers can't be read");
    if (subbands.size() != 0)
	throw runtime_error("test_read_channel_subbands: partial subbands returned from unavailable unit");

    // Enabled but idle interface.
    test_unit u4("host4", 1);
    u4.headers[0] = { make_header(false, false, "0.0.0.0", 0, 16) };
    if (!read_channel_subbands(u4, subbands, false) || (subbands.size() != 0))
	throw runtime_error("test_read_channel_subbands: idle interface should give an empty subband list");

    cerr << "success\n";
}


static void test_collate_band_tables()
{
    cerr << "test_collate_band_tables()";

    collation_initializer ini_params;
    ini_params.noisy = false;
    ini_params.emit_warnings = false;

    map<string,double> sky_freqs = { { "a", 1000.0 }, { "b", 3000.0 } };

    // Two interfaces whose subbands interleave, and must be sorted by start channel.
    auto u_ok = make_shared<test_unit> ("rfsoc1-ctrl-1", 2);
    u_ok->headers[0] = { make_header(true, true, "10.0.0.1", 0, 8), make_header(true, true, "10.0.0.3", 512, 8) };
    u_ok->headers[1] = { make_header(true, true, "10.0.0.2", 256, 8), make_header(true, true, "10.0.0.2", 264, 8) };

    auto u_disabled = make_shared<test_unit> ("rfsoc1-ctrl-2", 2);
    u_disabled->enabled = { false, false };

    auto u_unavailable = make_shared<test_unit> ("rfsoc2-ctrl-1", 2);
    u_unavailable->fail_enable_query = 0;

    auto u_corrupt = make_shared<test_unit> ("rfsoc2-ctrl-2", 1);
    u_corrupt->headers[0] = { make_header(true, true, "10.0.0.9", 0, 4), make_header(true, true, "10.0.0.9", 6, 4) };

    auto u_no_tuning = make_shared<test_unit> ("rfsoc3-ctrl-1", 1);
    u_no_tuning->headers[0] = { make_header(true, true, "10.0.0.1", 0, 8) };

    unit_map units;
    units[antenna_tuning("1a", "a")] = u_ok;
    units[antenna_tuning("1a", "b")] = u_disabled;
    units[antenna_tuning("2b", "a")] = u_unavailable;
    units[antenna_tuning("2b", "b")] = u_corrupt;
    units[antenna_tuning("3c", "c")] = u_no_tuning;

    collation_result result = collate_band_tables(units, sky_freqs, ini_params);

    if ((result.band_tables.size() != 2) || (result.unavailable.size() != 2) || (result.failures.size() != 1))
	throw runtime_error("test_collate_band_tables: wrong number of band tables, unavailable, or failed units");

    const band_table &t = result.band_tables.at(antenna_tuning("1a", "a"));
    if (t.len() != 3)
	throw runtime_error("test_collate_band_tables: expected 3 bands, got " + to_string(t.len()));

    if ((t.bands[0].channel_start != 0) || (t.bands[1].channel_start != 256) || (t.bands[2].channel_start != 512))
	throw runtime_error("test_collate_band_tables: bands not sorted by start channel");
    if ((t.bands[1].address != "10.0.0.2") || (t.bands[1].channel_stop != 272))
	throw runtime_error("test_collate_band_tables: bad merged band");

    for (int i = 0; i < t.len(); i++) {
	if (t.bands[i].index != i)
	    throw runtime_error("test_collate_band_tables: bad band index");
	double expected_start = 1000.0 + (t.bands[i].channel_start - 512.0) * 1.0;
	if (fabs(t.bands[i].frequency_start - expected_start) > 1.0e-9)
	    throw runtime_error("test_collate_band_tables: bad frequency_start");
    }

    if (result.band_tables.at(antenna_tuning("1a", "b")).len() != 0)
	throw runtime_error("test_collate_band_tables: all-disabled unit should give an empty band table");
    if (!result.unavailable.count(antenna_tuning("2b", "a")) || !result.unavailable.count(antenna_tuning("3c", "c")))
	throw runtime_error("test_collate_band_tables: missing unavailable markers");
    if (result.failures.at(antenna_tuning("2b", "b")).find("rfsoc2-ctrl-2") == string::npos)
	throw runtime_error("test_collate_band_tables: failure message doesn't name the unit");

    // Every unit is disconnected exactly once, whatever the outcome.
    for (const auto &kv: units) {
	const test_unit *u = dynamic_cast<const test_unit *> (kv.second.get());
	if (u->ndisconnect != 1)
	    throw runtime_error("test_collate_band_tables: " + u->hostname + " disconnected " + to_string(u->ndisconnect) + " times");
    }

    cerr << "success\n";
}


static void test_collate_rethrow()
{
    cerr << "test_collate_rethrow()";

    collation_initializer ini_params;
    ini_params.noisy = false;
    ini_params.emit_warnings = false;
    ini_params.throw_exception_on_integrity_error = true;

    auto u = make_shared<test_unit> ("rfsoc4-ctrl-1", 1);
    u->headers[0] = { make_header(true, true, "10.0.0.1", 0, 3), make_header(true, true, "10.0.0.1", 2, 3) };

    unit_map units;
    units[antenna_tuning("4d", "a")] = u;

    bool threw = false;
    try {
	collate_band_tables(units, { { "a", 1000.0 } }, ini_params);
    } catch (collation_error &e) {
	threw = (e.nchans == 5) && (e.packet_nchan == 3);
    }

    if (!threw)
	throw runtime_error("test_collate_rethrow: expected collation_error");
    if (u->ndisconnect != 1)
	throw runtime_error("test_collate_rethrow: unit not disconnected after collation_error");

    cerr << "success\n";
}


// A unit that throws something other than collation_error is isolated like any other
// unavailable unit, and doesn't discard results for the other units.
static void test_collate_unit_exception()
{
    cerr << "test_collate_unit_exception()";

    collation_initializer ini_params;
    ini_params.noisy = false;
    ini_params.emit_warnings = false;
    ini_params.throw_exception_on_integrity_error = true;

    auto u_before = make_shared<test_unit> ("rfsoc5-ctrl-1", 1);
    u_before->headers[0] = { make_header(true, true, "10.0.0.1", 0, 8) };

    auto u_throws = make_shared<test_unit> ("rfsoc5-ctrl-2", 2);
    u_throws->headers[0] = { make_header(true, true, "10.0.0.2", 0, 8) };
    u_throws->throw_on_headers = 1;

    auto u_after = make_shared<test_unit> ("rfsoc6-ctrl-1", 1);
    u_after->headers[0] = { make_header(true, true, "10.0.0.3", 8, 8) };

    unit_map units;
    units[antenna_tuning("5e", "a")] = u_before;
    units[antenna_tuning("5e", "b")] = u_throws;
    units[antenna_tuning("6f", "a")] = u_after;

    collation_result result = collate_band_tables(units, { { "a", 1000.0 }, { "b", 2000.0 } }, ini_params);

    if ((result.band_tables.size() != 2) || !result.band_tables.count(antenna_tuning("5e", "a")) || !result.band_tables.count(antenna_tuning("6f", "a")))
	throw runtime_error("test_collate_unit_exception: band tables of the other units were lost");
    if ((result.unavailable.size() != 1) || (result.failures.size() != 0))
	throw runtime_error("test_collate_unit_exception: throwing unit should be recorded as unavailable");
    if (result.unavailable.at(antenna_tuning("5e", "b")).find("connection reset") == string::npos)
	throw runtime_error("test_collate_unit_exception: unavailable cause should carry the exception message");

    for (const auto &kv: units) {
	const test_unit *u = dynamic_cast<const test_unit *> (kv.second.get());
	if (u->ndisconnect != 1)
	    throw runtime_error("test_collate_unit_exception: " + u->hostname + " disconnected " + to_string(u->ndisconnect) + " times");
    }

    cerr << "success\n";
}


static void test_make_unit_map()
{
    cerr << "test_make_unit_map()";

    vector<unit_table_entry> entries(3);
    entries[0].antenna = "1a";  entries[0].tuning = "a";  entries[0].hostname = "rfsoc1-ctrl-1";
    entries[1].antenna = "1a";  entries[1].tuning = "b";  entries[1].hostname = "rfsoc1-ctrl-2";
    entries[2].antenna = "2b";  entries[2].tuning = "a";  entries[2].hostname = "rfsoc2-ctrl-1";

    // The factory returns no unit for the second entry, which is omitted.
    auto factory = [](const unit_table_entry &e) -> shared_ptr<fengine_unit> {
	if (e.hostname == "rfsoc1-ctrl-2")
	    return shared_ptr<fengine_unit> ();
	return make_shared<test_unit> (e.hostname, 1);
    };

    unit_map units = make_unit_map(entries, factory);

    if ((units.size() != 2) || !units.count(antenna_tuning("1a","a")) || !units.count(antenna_tuning("2b","a")))
	throw runtime_error("test_make_unit_map: wrong units");
    if (units.at(antenna_tuning("2b","a"))->get_hostname() != "rfsoc2-ctrl-1")
	throw runtime_error("test_make_unit_map: wrong hostname");

    entries.push_back(entries[0]);

    bool threw = false;
    try {
	make_unit_map(entries, factory);
    } catch (runtime_error &e) {
	threw = true;
    }
    if (!threw)
	throw runtime_error("test_make_unit_map: duplicate entries should throw");

    cerr << "success\n";
}


// -------------------------------------------------------------------------------------------------


int main(int argc, char **argv)
{
    std::random_device rd;
    std::mt19937 rng(rd());

    test_merge_scenario();
    test_merge_ignores_non_first_headers();
    test_merge_nonadjacent_same_address();
    test_finalizer_rejects_partial_stream();
    test_finalizer_integer_streams(rng);
    test_channel_conservation(rng);
    test_frequency_scenario();
    test_frequency_symmetry(rng);
    test_read_channel_subbands();
    test_collate_band_tables();
    test_collate_rethrow();
    test_collate_unit_exception();
    test_make_unit_map();

    return 0;
}
