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

#include "emb-lin-fram/I2C_bus_base.hpp"

#include <spdlog/spdlog.h>

#include <linux/i2c-dev.h>

#include <sys/ioctl.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

I2C_bus_base::I2C_bus_base(const std::string& bus_path)
{
	m_fd = -1;
	m_bus_path = bus_path;
}
I2C_bus_base::~I2C_bus_base()
{
	// non-virtual dispatch here, derived classes clean up in their own dtor
	I2C_bus_base::close();
}

bool I2C_bus_base::open()
{
	if(m_fd >= 0)
	{
		return true;
	}
	
	int ret = ::open(m_bus_path.c_str(), O_RDWR);
	if(ret < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("Could not open bus {:s}, errno: {:d}", m_bus_path, err);
		errno = err;
		return false;
	}

	m_fd = ret;

	return true;
}
bool I2C_bus_base::close()
{
	if(m_fd < 0)
	{
		return true;
	}

	int ret = ::close(m_fd);
	if(ret != 0)
	{
		SPDLOG_WARN("Error on close bus {:s}, errno: {:d}", m_bus_path, errno);
	}

	m_fd = -1;

	return ret == 0;
}

int I2C_bus_base::transfer(i2c_msg* const msgs, const size_t nmsgs)
{
	if(m_fd < 0)
	{
		SPDLOG_ERROR("Bus {:s} is not open", m_bus_path);
		return -EBADF;
	}

	i2c_rdwr_ioctl_data idat {};
	idat.msgs  = msgs;
	idat.nmsgs = nmsgs;

	if(ioctl(m_fd, I2C_RDWR, &idat) < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("ioctl failed, errno: {:d}", err);
		return -err;
	}

	return 0;
}

I2C_bus_open_close::I2C_bus_open_close(I2C_bus_base& bus) : m_bus(bus), m_did_open(false)
{
	m_lock = std::unique_lock<std::recursive_mutex>(m_bus.get_mutex());

	if(m_bus.is_open())
	{
		return;
	}

	errno = 0;
	if( ! m_bus.open() )
	{
		const int err = (errno != 0) ? errno : ENODEV;
		throw I2C_bus_error("Could not open bus " + m_bus.get_path(), err);
	}

	m_did_open = true;
}
I2C_bus_open_close::~I2C_bus_open_close()
{
	if( ! m_did_open )
	{
		return;
	}

	if( ! m_bus.close() )
	{
		SPDLOG_ERROR("Error when closing bus");
	}
}
