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

#include <string>

#include <cstdint>

class FRAM_status
{
public:
	enum class CODE : uint8_t
	{
		OK,
		OUT_OF_RANGE,   // span exceeds the array, nothing was sent on the bus
		BUS_ERROR,      // transport failed, see get_bus_errno()
		UNKNOWN_DEVICE  // device id did not match
	};

	FRAM_status() : m_code(CODE::OK), m_bus_errno(0)
	{

	}

	static FRAM_status ok()
	{
		return FRAM_status(CODE::OK, 0);
	}
	static FRAM_status out_of_range()
	{
		return FRAM_status(CODE::OUT_OF_RANGE, 0);
	}
	static FRAM_status bus_error(const int err)
	{
		return FRAM_status(CODE::BUS_ERROR, err);
	}
	static FRAM_status unknown_device()
	{
		return FRAM_status(CODE::UNKNOWN_DEVICE, 0);
	}

	bool is_ok() const
	{
		return m_code == CODE::OK;
	}

	explicit operator bool() const
	{
		return is_ok();
	}

	CODE get_code() const
	{
		return m_code;
	}

	// errno reported by the transport, only meaningful for BUS_ERROR
	int get_bus_errno() const
	{
		return m_bus_errno;
	}

	std::string to_string() const;

	bool operator==(const FRAM_status& rhs) const
	{
		return (m_code == rhs.m_code) && (m_bus_errno == rhs.m_bus_errno);
	}

protected:
	FRAM_status(const CODE code, const int err) : m_code(code), m_bus_errno(err)
	{

	}

	CODE m_code;
	int  m_bus_errno;
};
