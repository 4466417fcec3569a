#include <numeric>
#include <iomanip>
#include "fengine_io_internals.hpp"

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


static string _collation_error_message(const string &hostname, int nchans, int packet_nchan, double nstreams)
{
    stringstream ss;
    ss << "Read headers from " << hostname << " that indicate non-integer number of streams: "
       << nchans << " / " << packet_nchan << " = " << setprecision(17) << nstreams;
    return ss.str();
}


collation_error::collation_error(const string &hostname_, int nchans_, int packet_nchan_, double nstreams_) :
    runtime_error(_collation_error_message(hostname_, nchans_, packet_nchan_, nstreams_)),
    hostname(hostname_),
    nchans(nchans_),
    packet_nchan(packet_nchan_),
    nstreams(nstreams_)
{ }


bool antenna_tuning::operator<(const antenna_tuning &x) const
{
    if (antenna != x.antenna)
	return antenna < x.antenna;
    return tuning < x.tuning;
}


// -------------------------------------------------------------------------------------------------
//
// Stream merger.
//
// merge_packet_streams() is a left fold over the header table.  The accumulator holds the completed
// segments, and at most one open segment, which is closed when a first-header with a different
// destination address arrives (or at the end of the table).


struct segment_accumulator {
    vector<stream_segment> completed;
    stream_segment open_segment;
    bool is_open = false;
};


static segment_accumulator _merge_header(segment_accumulator acc, const header_record &h)
{
    if (!h.valid || !h.first)
	return acc;

    if (acc.is_open && (acc.open_segment.dest == h.dest)) {
	acc.open_segment.end_chan = h.chans;
	return acc;
    }

    if (acc.is_open)
	acc.completed.push_back(acc.open_segment);

    acc.open_segment.dest = h.dest;
    acc.open_segment.start_chan = h.chans;
    acc.open_segment.end_chan = h.chans;
    acc.open_segment.packet_nchan = h.n_chans;
    acc.open_segment.is_8bit = h.is_8bit;
    acc.is_open = true;

    return acc;
}


vector<stream_segment> merge_packet_streams(const vector<header_record> &headers)
{
    segment_accumulator acc = std::accumulate(headers.begin(), headers.end(), segment_accumulator(), _merge_header);

    if (acc.is_open)
	acc.completed.push_back(acc.open_segment);

    return acc.completed;
}


// -------------------------------------------------------------------------------------------------
//
// Stream finalizer.


channel_subband finalize_stream_segment(const stream_segment &segment, const string &hostname)
{
    int stop = segment.end_chan + segment.packet_nchan;
    int nchans = stop - segment.start_chan;

    // A non-positive packet size can't tile the segment either.
    if (_unlikely(segment.packet_nchan <= 0))
	throw collation_error(hostname, nchans, segment.packet_nchan, 0.0);

    if (_unlikely(nchans % segment.packet_nchan != 0))
	throw collation_error(hostname, nchans, segment.packet_nchan, (double)nchans / (double)segment.packet_nchan);

    channel_subband ret;
    ret.dest = segment.dest;
    ret.start = segment.start_chan;
    ret.stop = stop;
    ret.nstreams = nchans / segment.packet_nchan;
    return ret;
}


// -------------------------------------------------------------------------------------------------
//
// Header reader: all interfaces of one unit.


bool read_channel_subbands(fengine_unit &unit, vector<channel_subband> &subbands, bool emit_warnings)
{
    subbands.clear();

    const string hostname = unit.get_hostname();
    const int ninterfaces = unit.get_ninterfaces();

    if (ninterfaces < 0)
	throw runtime_error("fengine_io: " + hostname + " reported negative number of interfaces");

    // The enabled flag of every interface is read before any headers.  If any of them can't
    // be read, we don't know which interfaces to scan, so the whole unit is unavailable.
    vector<bool> enabled(ninterfaces, false);
    bool any_enabled = false;

    for (int iface = 0; iface < ninterfaces; iface++) {
	bool e = false;
	if (!unit.read_interface_enabled(iface, e)) {
	    if (emit_warnings)
		cerr << ("fengine_io: warning: failed to query ethernet status of " + hostname + "[" + to_string(iface) + "]\n");
	    return false;
	}
	enabled[iface] = e;
	any_enabled = any_enabled || e;
    }

    if (!any_enabled) {
	if (emit_warnings)
	    cerr << ("fengine_io: warning: ethernet outputs of " + hostname + " are all disabled (ninterfaces=" + to_string(ninterfaces) + ")\n");
	return true;
    }

    vector<header_record> headers;

    for (int iface = 0; iface < ninterfaces; iface++) {
	if (!enabled[iface])
	    continue;

	if (!unit.read_headers(iface, headers)) {
	    if (emit_warnings)
		cerr << ("fengine_io: warning: failed to query headers of " + hostname + "[" + to_string(iface) + "]\n");
	    subbands.clear();
	    return false;
	}

	vector<stream_segment> segments = merge_packet_streams(headers);

	for (const stream_segment &s: segments)
	    subbands.push_back(finalize_stream_segment(s, hostname));
    }

    return true;
}


}  // namespace fengine_io
