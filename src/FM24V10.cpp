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

#include "emb-lin-fram/FM24V10.hpp"

#include <spdlog/spdlog.h>

#include <linux/i2c.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <cerrno>

FM24V10::FM24V10(const std::shared_ptr<I2C_bus_base>& bus, const FM24V10_addr_pins& pins) : m_bus(bus), m_resolver(pins)
{

}

FM24V10::FM24V10(const std::shared_ptr<I2C_bus_base>& bus, const long id) : m_bus(bus), m_resolver(get_pins_from_id(id))
{

}

FM24V10::~FM24V10()
{

}

FM24V10_addr_pins FM24V10::get_pins_from_id(const long id)
{
	// 0b1010_A2_A1_0, A16 must be clear and nothing above the 7 bit address
	if( (id & ~0x06L) != (long(FM24V10_addr_resolver::DEVICE_TYPE_CODE) << 3) )
	{
		throw std::domain_error("FM24V10 address must be one of 0x50, 0x52, 0x54, 0x56");
	}

	FM24V10_addr_pins pins;
	pins.a1 = (id & 0x02L) != 0;
	pins.a2 = (id & 0x04L) != 0;

	return pins;
}

FRAM_status FM24V10::probe()
{
	m_device_id.reset();

	uint32_t id;
	const FRAM_status ret = read_device_id(&id);
	if( ! ret )
	{
		return ret;
	}

	const uint32_t mf_code      = (id >> 12) & 0x0FFFU;
	const uint8_t  density_code = (id >>  8) & 0x000FU;
	if( (mf_code != MF_CODE) || (density_code != DENSITY_CODE) )
	{
		SPDLOG_DEBUG("FM24V10::probe unexpected device id 0x{:06X}", id);
		return FRAM_status::unknown_device();
	}

	m_device_id = id;

	return FRAM_status::ok();
}

FRAM_status FM24V10::read_device_id(uint32_t* const out_id)
{
	// i2ctransfer -a -y 0 w1@0x7C 0xA0 r3@0x7C

	std::array<uint8_t, 1> cmd;
	cmd[0] = get_base_addr() << 1U;

	std::array<uint8_t, 3> resp;

	std::array<i2c_msg, 2> trx {};
	trx[0].addr  = DEVICE_ID_ADDR;
	trx[0].flags = 0;
	trx[0].len   = cmd.size();
	trx[0].buf   = cmd.data();

	trx[1].addr  = DEVICE_ID_ADDR;
	trx[1].flags = I2C_M_RD;
	trx[1].len   = resp.size();
	trx[1].buf   = resp.data();

	try
	{
		std::shared_ptr<I2C_bus_open_close> bus_closer = std::make_shared<I2C_bus_open_close>(*m_bus);

		const int ret = m_bus->transfer(trx.data(), trx.size());
		if(ret < 0)
		{
			return FRAM_status::bus_error(-ret);
		}
	}
	catch(const I2C_bus_error& e)
	{
		return FRAM_status::bus_error(e.get_errno());
	}

	if(out_id)
	{
		*out_id = 
			(uint32_t(resp[0]) << 16) | 
			(uint32_t(resp[1]) <<  8) | 
			(uint32_t(resp[2]) <<  0);
	}

	return FRAM_status::ok();
}

FRAM_status FM24V10::sleep()
{
	// i2ctransfer -a -y 0 w1@0x7C 0xA0 w0@0x43
	std::array<uint8_t, 1> cmd;
	cmd[0] = get_base_addr() << 1U;

	std::array<i2c_msg, 2> trx {};
	trx[0].addr  = DEVICE_ID_ADDR;
	trx[0].flags = 0;
	trx[0].len   = cmd.size();
	trx[0].buf   = cmd.data();

	trx[1].addr  = SLEEP_CMD_ADDR;
	trx[1].flags = 0;
	trx[1].len   = 0;
	trx[1].buf   = nullptr;

	try
	{
		std::shared_ptr<I2C_bus_open_close> bus_closer = std::make_shared<I2C_bus_open_close>(*m_bus);

		const int ret = m_bus->transfer(trx.data(), trx.size());
		if(ret < 0)
		{
			return FRAM_status::bus_error(-ret);
		}
	}
	catch(const I2C_bus_error& e)
	{
		return FRAM_status::bus_error(e.get_errno());
	}

	return FRAM_status::ok();
}

FRAM_status FM24V10::wake()
{
	// i2ctransfer -a -y 0 r0@0x50
	std::array<i2c_msg, 1> trx {};
	trx[0].addr  = get_base_addr();
	trx[0].flags = I2C_M_RD;
	trx[0].len   = 0;
	trx[0].buf   = nullptr;

	try
	{
		std::shared_ptr<I2C_bus_open_close> bus_closer = std::make_shared<I2C_bus_open_close>(*m_bus);

		// a sleeping device may not ack the address that wakes it
		const int ret = m_bus->transfer(trx.data(), trx.size());
		if( (ret < 0) && (ret != -ENXIO) && (ret != -EREMOTEIO) )
		{
			return FRAM_status::bus_error(-ret);
		}
	}
	catch(const I2C_bus_error& e)
	{
		return FRAM_status::bus_error(e.get_errno());
	}

	std::this_thread::sleep_for(WAKE_RECOVERY_TIME);

	return FRAM_status::ok();
}

FRAM_status FM24V10::read(const size_t addr, void* const buf, const size_t size)
{
	SPDLOG_DEBUG("FM24V10::read 0x{:02X} {:d}@0x{:05X}", get_base_addr(), size, addr);

	FM24V10_plan trx_plan;
	FRAM_status ret = m_resolver.plan(addr, size, FM24V10_trx::DIR::READ, &trx_plan);
	if( ! ret )
	{
		SPDLOG_DEBUG("FM24V10::read {:d}@0x{:05X} out of range", size, addr);
		return ret;
	}

	return execute_plan(&trx_plan, static_cast<uint8_t*>(buf), nullptr);
}

FRAM_status FM24V10::write(const size_t addr, const void* const buf, const size_t size)
{
	SPDLOG_DEBUG("FM24V10::write 0x{:02X} {:d}@0x{:05X}", get_base_addr(), size, addr);

	FM24V10_plan trx_plan;
	FRAM_status ret = m_resolver.plan(addr, size, FM24V10_trx::DIR::WRITE, &trx_plan);
	if( ! ret )
	{
		SPDLOG_DEBUG("FM24V10::write {:d}@0x{:05X} out of range", size, addr);
		return ret;
	}

	return execute_plan(&trx_plan, nullptr, static_cast<const uint8_t*>(buf));
}

FRAM_status FM24V10::execute_plan(FM24V10_plan* const trx_plan, uint8_t* const rd_buf, const uint8_t* const wr_buf)
{
	if(trx_plan->empty())
	{
		return FRAM_status::ok();
	}

	try
	{
		// hold the bus across both banks
		std::shared_ptr<I2C_bus_open_close> bus_closer = std::make_shared<I2C_bus_open_close>(*m_bus);

		size_t num_done = 0;
		FM24V10_trx trx;
		while(trx_plan->next(&trx))
		{
			FRAM_status ret;
			switch(trx.dir)
			{
				case FM24V10_trx::DIR::READ:
				{
					ret = read_trx(trx, rd_buf + num_done);
					break;
				}
				case FM24V10_trx::DIR::WRITE:
				{
					ret = write_trx(trx, wr_buf + num_done);
					break;
				}
				default:
				{
					throw std::logic_error("Invalid FM24V10_trx::DIR");
				}
			}

			if( ! ret )
			{
				return ret;
			}

			num_done += trx.size;
		}
	}
	catch(const I2C_bus_error& e)
	{
		return FRAM_status::bus_error(e.get_errno());
	}

	return FRAM_status::ok();
}

FRAM_status FM24V10::fill(const uint8_t val)
{
	std::array<uint8_t, 256> buf;
	buf.fill(val);

	try
	{
		std::shared_ptr<I2C_bus_open_close> bus_closer = std::make_shared<I2C_bus_open_close>(*m_bus);

		for(size_t i = 0; i < CAPACITY; i += buf.size())
		{
			const size_t num_to_write = std::min(buf.size(), CAPACITY - i);

			const FRAM_status ret = write(i, buf.data(), num_to_write);
			if( ! ret )
			{
				return ret;
			}
		}
	}
	catch(const I2C_bus_error& e)
	{
		return FRAM_status::bus_error(e.get_errno());
	}

	return FRAM_status::ok();
}

FRAM_status FM24V10::read_trx(const FM24V10_trx& trx, uint8_t* const buf)
{
	SPDLOG_DEBUG("FM24V10::read_trx 0x{:02X} {:d}@0x{:04X}", trx.slave_addr, trx.size, trx.mem_addr);

	std::array<uint8_t, FM24V10_addr_resolver::MEM_ADDR_SIZE> addr_data = trx.get_addr_bytes();

	// set the address, then read the bank in msgs i2c-dev will accept
	// each repeated start read continues from the device's address counter
	std::vector<i2c_msg> msgs;
	msgs.reserve(1 + (trx.size + I2C_bus_base::MAX_MSG_LEN - 1) / I2C_bus_base::MAX_MSG_LEN);

	i2c_msg addr_msg {};
	addr_msg.addr  = trx.slave_addr;
	addr_msg.flags = 0;
	addr_msg.len   = addr_data.size();
	addr_msg.buf   = addr_data.data();
	msgs.push_back(addr_msg);

	for(size_t i = 0; i < trx.size; i += I2C_bus_base::MAX_MSG_LEN)
	{
		i2c_msg rd_msg {};
		rd_msg.addr  = trx.slave_addr;
		rd_msg.flags = I2C_M_RD;
		rd_msg.len   = std::min(I2C_bus_base::MAX_MSG_LEN, trx.size - i);
		rd_msg.buf   = buf + i;
		msgs.push_back(rd_msg);
	}

	const int ret = m_bus->transfer(msgs.data(), msgs.size());
	if(ret < 0)
	{
		return FRAM_status::bus_error(-ret);
	}

	return FRAM_status::ok();
}

FRAM_status FM24V10::write_trx(const FM24V10_trx& trx, const uint8_t* const buf)
{
	SPDLOG_DEBUG("FM24V10::write_trx 0x{:02X} {:d}@0x{:04X}", trx.slave_addr, trx.size, trx.mem_addr);

	const std::array<uint8_t, FM24V10_addr_resolver::MEM_ADDR_SIZE> addr_data = trx.get_addr_bytes();

	// gather IO not supported by several drivers and/or FT260S, so the address and first part of the payload share a temp buffer
	const size_t first_len = std::min(I2C_bus_base::MAX_MSG_LEN - addr_data.size(), trx.size);

	std::vector<uint8_t> write_buf;
	write_buf.reserve(addr_data.size() + first_len);
	write_buf.insert(write_buf.end(), addr_data.begin(), addr_data.end());
	write_buf.insert(write_buf.end(), buf, buf + first_len);

	std::vector<i2c_msg> msgs;
	msgs.reserve(1 + (trx.size - first_len + I2C_bus_base::MAX_MSG_LEN - 1) / I2C_bus_base::MAX_MSG_LEN);

	i2c_msg first_msg {};
	first_msg.addr  = trx.slave_addr;
	first_msg.flags = 0;
	first_msg.len   = write_buf.size();
	first_msg.buf   = write_buf.data();
	msgs.push_back(first_msg);

	// rest of a large burst continues without a restart
	for(size_t i = first_len; i < trx.size; i += I2C_bus_base::MAX_MSG_LEN)
	{
		i2c_msg wr_msg {};
		wr_msg.addr  = trx.slave_addr;
		wr_msg.flags = I2C_M_NOSTART;
		wr_msg.len   = std::min(I2C_bus_base::MAX_MSG_LEN, trx.size - i);
		wr_msg.buf   = const_cast<uint8_t*>(buf + i);
		msgs.push_back(wr_msg);
	}

	const int ret = m_bus->transfer(msgs.data(), msgs.size());
	if(ret < 0)
	{
		return FRAM_status::bus_error(-ret);
	}

	return FRAM_status::ok();
}
