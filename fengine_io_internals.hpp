#ifndef _FENGINE_IO_INTERNALS_HPP
#define _FENGINE_IO_INTERNALS_HPP

#if (__cplusplus < 201103) && !defined(__GXX_EXPERIMENTAL_CXX0X__)
#error "This source file needs to be compiled with C++11 support (g++ -std=c++11)"
#endif

#include <cmath>
#include <random>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>

#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>

#include <hdf5.h>

#include "fengine_io.hpp"


// This will compile to a "hint" for CPU branch prediction.  We use it for error detection
// in paths which see every header of every interface.

#ifndef _unlikely
#define _unlikely(cond)  (__builtin_expect(cond,0))
#endif


namespace fengine_io {
#if 0
}; // pacify emacs c-mode
#endif


// -------------------------------------------------------------------------------------------------


inline int randint(std::mt19937 &rng, int lo, int hi)
{
    return std::uniform_int_distribution<>(lo,hi-1)(rng);   // note hi-1 here!
}

inline double uniform_rand(std::mt19937 &rng)
{
    return std::uniform_real_distribution<>()(rng);
}

inline double uniform_rand(std::mt19937 &rng, double lo, double hi)
{
    return lo + (hi-lo) * uniform_rand(rng);
}

inline bool file_exists(const std::string &filename)
{
    struct stat s;

    int err = stat(filename.c_str(), &s);
    if (err >= 0)
        return true;
    if (errno == ENOENT)
        return false;

    throw std::runtime_error(filename + ": " + strerror(errno));
}

// returns string representation of a vector
template<typename T> inline std::string vstr(const T *buf, int n, int stride=1)
{
    std::stringstream ss;
    ss << "[";
    for (int i = 0; i < n; i++)
	ss << " " << buf[i*stride];
    ss << " ]";
    return ss.str();
}

template<typename T> inline std::string vstr(const std::vector<T> &buf)
{
    return vstr(&buf[0], buf.size());
}



inline struct timeval xgettimeofday()
{
    struct timeval tv;

    int err = gettimeofday(&tv, NULL);
    if (err)
	throw std::runtime_error("gettimeofday failed");

    return tv;
}

inline int64_t usec_between(const struct timeval &tv1, const struct timeval &tv2)
{
    return 1000000 * int64_t(tv2.tv_sec - tv1.tv_sec) + int64_t(tv2.tv_usec - tv1.tv_usec);
}


// -------------------------------------------------------------------------------------------------
//
// HDF5 wrappers (these are generally useful since the libhdf5 C/C++ api is so clunky)


template<typename T> inline hid_t hdf5_type();

// Reference: https://www.hdfgroup.org/HDF5/doc/H5.user/Datatypes.html
template<> inline hid_t hdf5_type<int>()            { return H5T_NATIVE_INT; }
template<> inline hid_t hdf5_type<uint32_t>()       { return H5T_NATIVE_UINT32; }
template<> inline hid_t hdf5_type<double>()         { return H5T_NATIVE_DOUBLE; }
template<> inline hid_t hdf5_type<unsigned char>()  { return H5T_NATIVE_UCHAR; }


struct hdf5_file : noncopyable {
    std::string filename;
    hid_t file_id;

    // If write=false, the file is opened read-only, and an exception is thrown if it doesn't exist.
    // If write=true, the file is opened for writing.  If the file already exists, it will either be clobbered
    // or an exception will be thrown, depending on the value of 'clobber'.
    hdf5_file(const std::string &filename, bool write=false, bool clobber=true);
    ~hdf5_file();

    bool has_group(const std::string &group_name) const;
};


struct hdf5_group : noncopyable {
    std::string filename;
    std::string group_name;
    hid_t group_id;

    // If create=true, the group will be created (and an exception is thrown if it already exists).
    hdf5_group(const hdf5_file &f, const std::string &group_name, bool create=false);
    ~hdf5_group();

    bool has_dataset(const std::string &dataset_name) const;

    // Read scalar attribute
    template<typename T> T read_attribute(const std::string &attr_name) const
    {
	T ret;
	this->_read_attribute(attr_name, hdf5_type<T>(), reinterpret_cast<void *> (&ret));
	return ret;
    }

    // Write scalar attribute
    template<typename T> void write_attribute(const std::string &attr_name, const T &x)
    {
	this->_write_attribute(attr_name, hdf5_type<T>(), reinterpret_cast<const void *> (&x));
    }

    // Read 1D dataset, whose length must be 'expected_len'.
    template<typename T> void read_dataset(const std::string &dataset_name, std::vector<T> &out, hsize_t expected_len) const
    {
	out.resize(expected_len);
	if (expected_len > 0)
	    this->_read_dataset(dataset_name, hdf5_type<T>(), reinterpret_cast<void *> (&out[0]), expected_len);
    }

    // Write 1D dataset
    template<typename T> void write_dataset(const std::string &dataset_name, const std::vector<T> &data)
    {
	if (data.size() == 0)
	    throw std::runtime_error(filename + ": attempt to write length-zero dataset '" + dataset_name + "'");
	this->_write_dataset(dataset_name, hdf5_type<T>(), reinterpret_cast<const void *> (&data[0]), data.size());
    }

    // This interface is intended for small string-valued datasets.
    void write_string_dataset(const std::string &dataset_name, const std::vector<std::string> &data);
    void read_string_dataset(const std::string &dataset_name, std::vector<std::string> &data, hsize_t expected_len) const;

    // Helpers
    void _read_attribute(const std::string &attr_name, hid_t hdf5_type, void *out) const;
    void _write_attribute(const std::string &attr_name, hid_t hdf5_type, const void *data);
    void _get_dataset_shape(const std::string &dataset_name, hid_t dataset_id, std::vector<hsize_t> &shape) const;
    void _check_dataset_len(const std::string &dataset_name, hid_t dataset_id, hsize_t expected_len) const;
    void _read_dataset(const std::string &dataset_name, hid_t hdf5_type, void *out, hsize_t expected_len) const;
    void _write_dataset(const std::string &dataset_name, hid_t hdf5_type, const void *data, hsize_t len);
};


}  // namespace fengine_io

#endif // _FENGINE_IO_INTERNALS_HPP
