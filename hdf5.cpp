#include <iostream>
#include "fengine_io_internals.hpp"

//
// Minimal C++ wrappers for the libhdf5 C library.
//
// Only what the header capture files need: scalar attributes, and 1D numeric or string datasets.
//

using namespace std;

namespace fengine_io {
#if 0
};  // pacify emacs c-mode!
#endif


hdf5_file::hdf5_file(const string &filename_, bool write, bool clobber)
{
    this->filename = filename_;

    if (write) {
	if (!clobber && file_exists(filename))
	    throw runtime_error(filename + ": file already exists, and clobber=false was specified when creating file");
	this->file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    }
    else
	this->file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);

    if (file_id < 0)
	throw runtime_error(filename + ": couldn't open file");
}


hdf5_file::~hdf5_file()
{
    H5Fclose(file_id);
}


bool hdf5_file::has_group(const string &group_name) const
{
    htri_t ret = H5Lexists(file_id, group_name.c_str(), H5P_DEFAULT);
    if (ret < 0)
	throw runtime_error(filename + ": H5Lexists() failed for '" + group_name + "'");
    return ret > 0;
}


hdf5_group::hdf5_group(const hdf5_file &f, const string &group_name_, bool create)
{
    this->filename = f.filename;
    this->group_name = group_name_;
    this->group_id = create ? H5Gcreate2(f.file_id, group_name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT)
	: H5Gopen2(f.file_id, group_name.c_str(), H5P_DEFAULT);

    if (group_id < 0)
	throw runtime_error(filename + ": couldn't open group '" + group_name + "'");
}


hdf5_group::~hdf5_group()
{
    H5Gclose(group_id);
}


void hdf5_group::_read_attribute(const string &attr_name, hid_t hdf5_type, void *out) const
{
    hid_t attr_id = H5Aopen(this->group_id, attr_name.c_str(), H5P_DEFAULT);
    if (attr_id < 0)
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": attribute not found");

    hid_t space_id = H5Aget_space(attr_id);
    if (space_id < 0) {
	H5Aclose(attr_id);
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": get_space() failed?!");
    }

    int ndims = H5Sget_simple_extent_ndims(space_id);
    H5Sclose(space_id);

    if (ndims != 0) {
	H5Aclose(attr_id);
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": expected scalar attribute");
    }

    herr_t err = H5Aread(attr_id, hdf5_type, out);
    H5Aclose(attr_id);

    if (err < 0)
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": attribute read failed?!");
}


void hdf5_group::_write_attribute(const string &attr_name, hid_t hdf5_type, const void *data)
{
    hid_t space_id = H5Screate(H5S_SCALAR);
    if (space_id < 0)
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": H5Screate() failed?!");

    hid_t attr_id = H5Acreate2(group_id, attr_name.c_str(), hdf5_type, space_id, H5P_DEFAULT, H5P_DEFAULT);
    if (attr_id < 0) {
	H5Sclose(space_id);
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": couldn't create attribute");
    }

    herr_t err = H5Awrite(attr_id, hdf5_type, data);

    H5Aclose(attr_id);
    H5Sclose(space_id);

    if (err < 0)
	throw runtime_error(filename + ":" + group_name + "/" + attr_name + ": couldn't write attribute");
}


void hdf5_group::_get_dataset_shape(const string &dataset_name, hid_t dataset_id, vector<hsize_t> &shape) const
{
    hid_t space_id = H5Dget_space(dataset_id);
    if (space_id < 0)
	throw runtime_error(filename + ": couldn't open dataspace in dataset '" + dataset_name + "'?!");

    int ndims = H5Sget_simple_extent_ndims(space_id);
    if (ndims < 0) {
	H5Sclose(space_id);
	throw runtime_error(filename + ": couldn't get dimensions of dataset '" + dataset_name + "'?!");
    }

    shape.resize(ndims, 0);

    int err = (ndims > 0) ? H5Sget_simple_extent_dims(space_id, &shape[0], NULL) : 0;
    H5Sclose(space_id);

    if (err < 0)
	throw runtime_error(filename + ": couldn't get dimensions of dataset '" + dataset_name + "'?!");
}


void hdf5_group::_check_dataset_len(const string &dataset_name, hid_t dataset_id, hsize_t expected_len) const
{
    vector<hsize_t> shape;
    this->_get_dataset_shape(dataset_name, dataset_id, shape);

    if (shape.size() != 1)
	throw runtime_error(filename + ": dataset '" + dataset_name + "' is a " + to_string(shape.size()) + "-d array, expected 1-d array");
    if (shape[0] != expected_len)
	throw runtime_error(filename + ": dataset '" + dataset_name + "' has length " + to_string(shape[0]) + ", expected length " + to_string(expected_len));
}


void hdf5_group::_read_dataset(const string &dataset_name, hid_t hdf5_type, void *out, hsize_t expected_len) const
{
    hid_t dataset_id = H5Dopen2(this->group_id, dataset_name.c_str(), H5P_DEFAULT);
    if (dataset_id < 0)
	throw runtime_error(filename + ": dataset '" + dataset_name + "' not found");

    try {
	this->_check_dataset_len(dataset_name, dataset_id, expected_len);
    } catch (...) {
	H5Dclose(dataset_id);
	throw;
    }

    herr_t err = H5Dread(dataset_id, hdf5_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, out);
    H5Dclose(dataset_id);

    if (err < 0)
	throw runtime_error(filename + ": error reading dataset '" + dataset_name + "'");
}


void hdf5_group::_write_dataset(const string &dataset_name, hid_t hdf5_type, const void *data, hsize_t len)
{
    hid_t space_id = H5Screate_simple(1, &len, NULL);
    if (space_id < 0)
	throw runtime_error(filename + ": couldn't create dataspace for dataset '" + dataset_name + "'?!");

    hid_t dataset_id = H5Dcreate2(group_id, dataset_name.c_str(), hdf5_type, space_id, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dataset_id < 0) {
	H5Sclose(space_id);
	throw runtime_error(filename + ": couldn't create dataset '" + dataset_name + "'");
    }

    herr_t ret = H5Dwrite(dataset_id, hdf5_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data);

    H5Dclose(dataset_id);
    H5Sclose(space_id);

    if (ret < 0)
	throw runtime_error(filename + ": error writing dataset '" + dataset_name + "'");
}


//
// References:
//   https://www.hdfgroup.org/ftp/HDF5/examples/examples-by-api/hdf5-examples/1_8/C/H5T/h5ex_t_string.c
//   https://www.hdfgroup.org/ftp/HDF5/examples/examples-by-api/hdf5-examples/1_8/C/H5T/h5ex_t_vlstring.c
//
// Only variable-length strings are supported, since write_string_dataset() never writes anything else.
//
void hdf5_group::read_string_dataset(const std::string &dataset_name, std::vector<std::string> &data, hsize_t expected_len) const
{
    data.clear();

    hid_t dataset_id = H5Dopen2(this->group_id, dataset_name.c_str(), H5P_DEFAULT);
    if (dataset_id < 0)
	throw runtime_error(filename + ": dataset '" + dataset_name + "' not found");

    hid_t memtype = H5Tcopy(H5T_C_S1);
    hid_t space_id = H5Dget_space(dataset_id);
    hid_t datatype_id = H5Dget_type(dataset_id);

    // Closes everything on all exit paths from here on.
    auto cleanup = [&]() {
	if (datatype_id >= 0)
	    H5Tclose(datatype_id);
	if (space_id >= 0)
	    H5Sclose(space_id);
	if (memtype >= 0)
	    H5Tclose(memtype);
	H5Dclose(dataset_id);
    };

    string err;

    if (memtype < 0)
	err = "H5Tcopy() failed?!";
    else if (space_id < 0)
	err = "H5Dget_space() failed on string-valued dataset '" + dataset_name + "'";
    else if (datatype_id < 0)
	err = "H5Dget_type() failed on string-valued dataset '" + dataset_name + "'";
    else if (H5Tis_variable_str(datatype_id) <= 0)
	err = "expected variable-length strings in dataset '" + dataset_name + "'";

    if (err.size() == 0) {
	try {
	    this->_check_dataset_len(dataset_name, dataset_id, expected_len);
	} catch (...) {
	    cleanup();
	    throw;
	}
    }

    if ((err.size() == 0) && (expected_len > 0)) {
	vector<char *> c_strings(expected_len, nullptr);

	if (H5Tset_size(memtype, H5T_VARIABLE) < 0)
	    err = "H5Tset_size() failed?!";
	else if (H5Dread(dataset_id, memtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, &c_strings[0]) < 0)
	    err = "couldn't read string-valued dataset '" + dataset_name + "'";
	else {
	    for (hsize_t i = 0; i < expected_len; i++)
		data.push_back(c_strings[i] ? string(c_strings[i]) : string());
	    H5Dvlen_reclaim(memtype, space_id, H5P_DEFAULT, &c_strings[0]);
	}
    }

    cleanup();

    if (err.size() > 0)
	throw runtime_error(filename + ": " + err);
}


void hdf5_group::write_string_dataset(const string &dataset_name, const vector<string> &data)
{
    if (data.size() == 0)
	throw runtime_error(filename + ": attempt to write length-zero string dataset '" + dataset_name + "'");

    vector<const char *> cstr_array(data.size());
    for (unsigned int i = 0; i < data.size(); i++)
	cstr_array[i] = data[i].c_str();

    hsize_t len = data.size();
    hid_t space_id = H5Screate_simple(1, &len, NULL);
    if (space_id < 0)
	throw runtime_error(filename + ": couldn't create dataspace for dataset '" + dataset_name + "'?!");

    hid_t datatype_id = H5Tcopy(H5T_C_S1);
    if (datatype_id < 0) {
	H5Sclose(space_id);
	throw runtime_error(filename + ": couldn't create datatype for dataset '" + dataset_name + "'?!");
    }

    string err;
    hid_t dataset_id = -1;

    if (H5Tset_size(datatype_id, H5T_VARIABLE) < 0)
	err = "H5Tset_size() failed when creating dataset '" + dataset_name + "'?!";
    else if ((dataset_id = H5Dcreate2(group_id, dataset_name.c_str(), datatype_id, space_id, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT)) < 0)
	err = "couldn't create string-valued dataset '" + dataset_name + "'";
    else if (H5Dwrite(dataset_id, datatype_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, &cstr_array[0]) < 0)
	err = "couldn't write string-valued dataset '" + dataset_name + "'";

    if (dataset_id >= 0)
	H5Dclose(dataset_id);
    H5Tclose(datatype_id);
    H5Sclose(space_id);

    if (err.size() > 0)
	throw runtime_error(filename + ": " + err);
}


bool hdf5_group::has_dataset(const string &dataset_name) const
{
    htri_t ret = H5Lexists(this->group_id, dataset_name.c_str(), H5P_DEFAULT);
    if (ret < 0)
	throw runtime_error(filename + ":" + group_name + "/" + dataset_name + ": H5Lexists() failed");
    return ret > 0;
}


}  // namespace fengine_io
