/**
 * This file is part of emb-lin-fram, a userspace driver for I2C F-RAM on embedded linux.
 * 
 * This software is distrubuted in the hope it will be useful, but without any warranty, including the implied warrranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See LICENSE.txt for details.
 * 
 * @author Jacob Schloss <jacob.schloss@suburbanmarine.io>
 * @copyright Copyright (c) 2025 Suburban Marine, Inc. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include <linux/i2c.h>

#include <mutex>
#include <stdexcept>
#include <string>

#include <cstddef>

class I2C_bus_error : public std::runtime_error
{
public:
	I2C_bus_error(const std::string& what, const int err) : std::runtime_error(what), m_errno(err)
	{

	}

	int get_errno() const
	{
		return m_errno;
	}

protected:
	int m_errno;
};

// A linux i2c-dev bus, eg /dev/i2c-1
class I2C_bus_base
{
public:
	// i2c-dev rejects I2C_RDWR msgs longer than this
	static constexpr size_t MAX_MSG_LEN = 8192;

	I2C_bus_base(const std::string& bus_path);
	virtual ~I2C_bus_base();

	virtual bool open();
	virtual bool close();

	virtual bool is_open() const
	{
		return m_fd >= 0;
	}

	// Issue msgs as one combined transaction, repeated start between each msg
	// returns 0 on success, -errno on failure
	virtual int transfer(i2c_msg* const msgs, const size_t nmsgs);

	int get_fd() const
	{
		return m_fd;
	}

	std::recursive_mutex& get_mutex()
	{
		return m_mutex;
	}

	std::string get_path() const
	{
		return m_bus_path;
	}

protected:

	std::recursive_mutex m_mutex;

	int m_fd;
	std::string m_bus_path;
};

// Locks and opens the bus for the lifetime of the object
// Nested guards on the same thread leave the bus open until the outermost one is released
class I2C_bus_open_close
{
public:
	I2C_bus_open_close(I2C_bus_base& bus);
	virtual ~I2C_bus_open_close();
protected:
	I2C_bus_base& m_bus;
	std::unique_lock<std::recursive_mutex> m_lock;
	bool m_did_open;
};
