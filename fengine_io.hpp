#ifndef _FENGINE_IO_HPP
#define _FENGINE_IO_HPP

#if (__cplusplus < 201103) && !defined(__GXX_EXPERIMENTAL_CXX0X__)
#error "This source file needs to be compiled with C++11 support (g++ -std=c++11)"
#endif

#include <map>
#include <iosfwd>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <functional>
#include <cstdint>

namespace fengine_io {
#if 0
}; // pacify emacs c-mode
#endif


struct noncopyable
{
    noncopyable() { }
    noncopyable(const noncopyable &) = delete;
    noncopyable& operator=(const noncopyable &) = delete;
};


// -------------------------------------------------------------------------------------------------
//
// Compile-time constants


namespace constants {
    // An F-Engine network interface is enabled iff this bit is set in its "eth%d_ctrl" register.
    static constexpr uint32_t eth_ctrl_enable_bit = 0x00000002;

    // Tunings (LO's) which are queried if the caller doesn't specify a list.
    static constexpr const char *default_tunings = "abcd";

    // The key prefix used by flatten_band_tables().
    static constexpr const char *metadata_key_prefix = "observatory.antenna";

    // Version number of the msgpack encoding of collation_result (see band_table_msgpack.hpp)
    static constexpr int collation_result_msgpack_version = 1;
};


// -------------------------------------------------------------------------------------------------
//
// Packet-destination headers, stream segments and subbands.
//
// Each F-Engine interface has a table of packet headers, one per packet "slot", in ascending
// channel order.  A header with the 'first' flag set marks the first packet of a logical stream.
// The header format has no end-of-stream marker, so a stream extends until the next first-header
// with a different destination address (or the end of the table).


struct header_record {
    bool valid = false;
    bool first = false;
    std::string dest;     // destination address, e.g. "10.11.1.150"
    int chans = 0;        // channel index at which this packet begins
    int n_chans = 0;      // channels per packet
    bool is_8bit = false;
};


// A run of consecutive same-destination first-headers.  Only mutable while it's the open
// segment in merge_packet_streams().
struct stream_segment {
    std::string dest;
    int start_chan = 0;    // 'chans' of the first header in the run
    int end_chan = 0;      // 'chans' of the last header in the run (not an exclusive bound!)
    int packet_nchan = 0;
    bool is_8bit = false;
};


struct channel_subband {
    std::string dest;
    int start = 0;
    int stop = 0;          // exclusive
    int nstreams = 0;      // always equal to (stop-start) / packet_nchan
};


struct frequency_band {
    int index = 0;         // position in band_table::bands
    int channel_start = 0;
    int channel_stop = 0;
    std::string address;
    double frequency_start = 0.0;
    double frequency_stop = 0.0;
};


struct antenna_tuning {
    std::string antenna;
    std::string tuning;

    antenna_tuning() { }
    antenna_tuning(const std::string &antenna_, const std::string &tuning_) : antenna(antenna_), tuning(tuning_) { }

    std::string str() const { return antenna + tuning; }
    bool operator<(const antenna_tuning &x) const;
    bool operator==(const antenna_tuning &x) const { return (antenna == x.antenna) && (tuning == x.tuning); }
};


struct band_table {
    antenna_tuning pair;
    std::vector<frequency_band> bands;

    int len() const { return bands.size(); }
};


//
// Thrown when an F-Engine reports a channel layout which can't be reconciled into a whole
// number of packet streams.  This indicates corrupted hardware/driver state, and is kept
// distinct from a failed hardware query (which is reported by a 'false' return value).
//
struct collation_error : public std::runtime_error {
    const std::string hostname;
    const int nchans;            // width of the offending stream segment
    const int packet_nchan;
    const double nstreams;       // nchans / packet_nchan (not an integer!)

    collation_error(const std::string &hostname, int nchans, int packet_nchan, double nstreams);
};


// -------------------------------------------------------------------------------------------------
//
// fengine_unit: the interface to one F-Engine board.
//
// Subclasses talk to hardware (or replay a capture file, see header_capture_file below).
// Hardware queries are blocking, and the caller is responsible for bounding them.


class fengine_unit : noncopyable {
public:
    virtual ~fengine_unit() { }

    virtual std::string get_hostname() const = 0;
    virtual int get_ninterfaces() const = 0;

    // Reads the interface control register.  Returns true on success, false if the
    // register couldn't be read.
    virtual bool read_interface_enabled(int iface, bool &enabled) = 0;

    // Reads the ordered header table of one interface.  Returns true on success, false on transport failure.
    virtual bool read_headers(int iface, std::vector<header_record> &headers) = 0;

    // Calibration constants: total number of channelizer channels, and the (signed) channel bandwidth.
    virtual int get_nchan_tot() const = 0;
    virtual double get_chan_bandwidth() const = 0;

    // Releases the hardware connection.  May be called more than once, and must not throw.
    virtual void disconnect() noexcept = 0;
};


typedef std::map<antenna_tuning, std::shared_ptr<fengine_unit> > unit_map;


// -------------------------------------------------------------------------------------------------
//
// Collation engine


//
// Folds the ordered header table of one interface into stream segments.  Only headers with
// (valid && first) are considered.  Consecutive first-headers are merged whenever their
// destination addresses are equal, without checking that the channels are adjacent.
//
// Precondition: the real hardware never repeats a destination address in a non-adjacent run
// of the same interface.  If it does, the two runs come out as one segment.
//
extern std::vector<stream_segment> merge_packet_streams(const std::vector<header_record> &headers);

// Throws collation_error if the segment doesn't contain an integer number of packet streams.
extern channel_subband finalize_stream_segment(const stream_segment &segment, const std::string &hostname);

//
// Runs the header reader, merger and finalizer over all enabled interfaces of the unit.
//
// Returns false if any interface's enabled flag or header table couldn't be read (the unit
// should be treated as unavailable).  Returns true with an empty 'subbands' vector if all
// interfaces are disabled or idle.  Throws collation_error on inconsistent headers.
//
// The subbands are returned in interface order, and are not sorted across interfaces.
//
extern bool read_channel_subbands(fengine_unit &unit, std::vector<channel_subband> &subbands, bool emit_warnings=true);

//
// The 'subbands' vector must be sorted by 'start'.
//
// The 'chan_bw' arg is signed (negative for an inverted spectrum), and 'sky_freq' is the
// center frequency of the tuning, in the same units.  The i-th channel of the F-Engine spans
//
//    [ sky_freq + (i - nchan_tot/2) * chan_bw, sky_freq + (i+1 - nchan_tot/2) * chan_bw ]
//
// where nchan_tot/2 is not rounded.
//
extern std::vector<frequency_band> map_frequency_bands(const std::vector<channel_subband> &subbands, int nchan_tot, double chan_bw, double sky_freq);


struct collation_result {
    std::map<antenna_tuning, band_table> band_tables;
    std::map<antenna_tuning, std::string> unavailable;   // value is a short description of the cause
    std::map<antenna_tuning, std::string> failures;      // value is the collation_error message

    void write_msgpack_file(const std::string &filename) const;
    static collation_result read_msgpack_file(const std::string &filename);
};


struct collation_initializer {
    bool noisy = true;            // print a one-line summary when collation completes
    bool emit_warnings = true;    // print a line for each unavailable unit

    // If true, a collation_error is rethrown (after the unit is disconnected), rather than
    // being recorded in collation_result::failures.  Useful in unit tests.
    bool throw_exception_on_integrity_error = false;
};


//
// Collates every unit in 'units'.  The 'sky_freqs' argument maps a tuning id to its current sky
// frequency.  Each unit is disconnected when its collation completes, whether or not it succeeded.
// A std::runtime_error (other than collation_error) thrown by a unit is recorded in 'unavailable'
// with its message, and collation continues with the next unit.
//
extern collation_result collate_band_tables(const unit_map &units, const std::map<std::string,double> &sky_freqs,
					    const collation_initializer &ini_params = collation_initializer());


// -------------------------------------------------------------------------------------------------
//
// Unit table: maps (antenna, tuning) pairs to F-Engine hosts.
//
// The file format is a whitespace-separated table with a header row.  The columns "ANT_name",
// "LO", and "snap_hostname" are required, and other columns are ignored.  Blank lines and lines
// starting with '#' are skipped.


struct unit_table_entry {
    std::string antenna;
    std::string tuning;
    std::string hostname;
    int pipeline_id = 0;    // last character of the hostname, minus one
};


struct unit_table {
    std::string filename;
    std::vector<unit_table_entry> entries;

    explicit unit_table(const std::string &filename, bool noisy=true);

    // Parses table text (e.g. from a file that has already been read).  The 'filename' is only used in error messages.
    unit_table(const std::string &filename, std::istream &in);

    // Returns entries whose antenna is in 'antennas' and whose tuning is in 'tunings'.
    std::vector<unit_table_entry> select(const std::vector<std::string> &antennas, const std::vector<std::string> &tunings) const;

protected:
    void _parse(std::istream &in);
};


typedef std::function<std::shared_ptr<fengine_unit> (const unit_table_entry &)> unit_factory;

// A factory which returns an empty pointer omits the pair (e.g. no hardware is reachable).
extern unit_map make_unit_map(const std::vector<unit_table_entry> &entries, const unit_factory &factory);


// -------------------------------------------------------------------------------------------------
//
// HDF5 header capture files.
//
// A capture file holds the state of one F-Engine (control registers, header tables, calibration
// constants) so that collation can be replayed offline.  The layout is:
//
//   /unit                     group with attributes nchan_tot (int), chan_bw (double),
//                             sky_freq (double), ninterfaces (int)
//   /unit/identity            string dataset [ antenna, tuning, hostname ]
//   /unit/eth_ctrl            uint32 dataset of length ninterfaces, raw register values
//   /unit/eth_ctrl_ok         uchar dataset of length ninterfaces, 0 if the register query failed
//   /iface<N>                 group with attribute nheaders (int), present iff headers were read
//   /iface<N>/{valid,first,is_8bit}    uchar datasets of length nheaders
//   /iface<N>/{chans,n_chans}          int datasets of length nheaders
//   /iface<N>/dest                     string dataset of length nheaders
//
// The header datasets are omitted when nheaders == 0.


struct header_capture {
    std::string antenna;
    std::string tuning;
    std::string hostname;
    int nchan_tot = 0;
    double chan_bw = 0.0;
    double sky_freq = 0.0;

    std::vector<uint32_t> eth_ctrl;                       // length ninterfaces
    std::vector<unsigned char> eth_ctrl_ok;               // length ninterfaces, 0 means query failed
    std::map<int, std::vector<header_record> > headers;   // iface -> header table
};


extern void write_header_capture_file(const std::string &filename, const header_capture &capture, bool clobber=true);


class header_capture_file : public fengine_unit {
public:
    const std::string filename;
    header_capture capture;

    // The file is read in full by the constructor.  If 'noisy' is true, then a one-line message is printed.
    explicit header_capture_file(const std::string &filename, bool noisy=true);

    virtual std::string get_hostname() const override { return capture.hostname; }
    virtual int get_ninterfaces() const override { return capture.eth_ctrl.size(); }
    virtual bool read_interface_enabled(int iface, bool &enabled) override;
    virtual bool read_headers(int iface, std::vector<header_record> &headers) override;
    virtual int get_nchan_tot() const override { return capture.nchan_tot; }
    virtual double get_chan_bandwidth() const override { return capture.chan_bw; }
    virtual void disconnect() noexcept override;

    bool is_connected() const { return connected; }

protected:
    bool connected = true;
};


// -------------------------------------------------------------------------------------------------
//
// Metadata flattening.
//
// The metadata server publishes each band table as flat key/value pairs, e.g.
//
//   observatory.antenna.1c.tunings.a.bands.len = 2
//   observatory.antenna.1c.tunings.a.bands.0.channel_start = 0
//   observatory.antenna.1c.tunings.a.bands.0.frequency_start = 488.0
//
// together with a type tag, which is one of "string", "u32" (booleans), "i64" (negative integers),
// "u64" (non-negative integers), or "f64".


struct metadata_value {
    enum value_type {
	type_string = 0,
	type_u32 = 1,
	type_i64 = 2,
	type_u64 = 3,
	type_f64 = 4
    };

    std::string key;
    value_type type = type_string;

    std::string s;
    int64_t i = 0;      // used for u32, i64, u64
    double f = 0.0;

    static metadata_value make_string(const std::string &key, const std::string &s);
    static metadata_value make_bool(const std::string &key, bool b);
    static metadata_value make_int(const std::string &key, int64_t i);
    static metadata_value make_float(const std::string &key, double f);

    const char *type_name() const;
    std::string value_str() const;
};


extern std::vector<metadata_value> flatten_band_tables(const collation_result &result);


// -------------------------------------------------------------------------------------------------


// Utility routine: converts a string to type T (only a few T's are defined; see lexical_cast.cpp)
// Returns true on success, false on failure
template<typename T> extern bool lexical_cast(const std::string &x, T &ret);

// Also defined in lexical_cast.cpp (for the same values of T)
template<typename T> extern const char *typestr();

// Version of lexical_cast() which throws exception on failure.
template<typename T> inline T lexical_cast(const std::string &x)
{
    T ret;
    if (lexical_cast(x, ret))
	return ret;
    throw std::runtime_error("fengine_io: couldn't convert string '" + x + "' to " + typestr<T>());
}

// Splits a string on a delimiter, dropping empty tokens, e.g. split_list("1a,,2b", ',') -> [ "1a", "2b" ]
extern std::vector<std::string> split_list(const std::string &s, char delim);

// Unit tests
extern void test_lexical_cast();


}  // namespace fengine_io

#endif // _FENGINE_IO_HPP
