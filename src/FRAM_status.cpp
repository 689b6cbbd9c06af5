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

#include "emb-lin-fram/FRAM_status.hpp"

#include <fmt/format.h>

std::string FRAM_status::to_string() const
{
	switch(m_code)
	{
		case CODE::OK:
		{
			return "OK";
		}
		case CODE::OUT_OF_RANGE:
		{
			return "OUT_OF_RANGE";
		}
		case CODE::BUS_ERROR:
		{
			return fmt::format("BUS_ERROR(errno {:d})", m_bus_errno);
		}
		case CODE::UNKNOWN_DEVICE:
		{
			return "UNKNOWN_DEVICE";
		}
		default:
		{
			break;
		}
	}

	return fmt::format("UNKNOWN({:d})", uint8_t(m_code));
}
