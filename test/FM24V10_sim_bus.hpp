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

#include "emb-lin-fram/I2C_bus_base.hpp"

#include <linux/i2c.h>

#include <optional>
#include <vector>

#include <cerrno>
#include <cstdint>

// Simulates one FM24V10 on an i2c bus
// The address counter wraps inside the addressed bank, so a transaction that runs past a bank boundary is visible as corrupt data
class FM24V10_sim_bus : public I2C_bus_base
{
public:
	static constexpr size_t   CAPACITY  = 128*1024;
	static constexpr size_t   BANK_SIZE = 64*1024;
	static constexpr uint32_t DEVICE_ID = 0x004400U;

	struct Msg_record
	{
		uint16_t addr;
		uint16_t flags;
		uint16_t len;
	};

	struct Trx_record
	{
		std::vector<Msg_record> msgs;
		int ret;
	};

	FM24V10_sim_bus(const uint8_t base_addr) : I2C_bus_base("/dev/i2c-sim"), m_base_addr(base_addr), m_mem(CAPACITY, 0)
	{
		m_open        = false;
		m_sleeping    = false;
		m_fail_open   = false;
		m_fail_errno  = EREMOTEIO;
		m_device_id   = DEVICE_ID;
		m_counter     = 0;
		m_open_count  = 0;
	}

	~FM24V10_sim_bus() override
	{

	}

	bool open() override
	{
		if(m_fail_open)
		{
			errno = ENOENT;
			return false;
		}

		if( ! m_open )
		{
			m_open_count++;
		}

		m_open = true;
		return true;
	}
	bool close() override
	{
		m_open = false;
		return true;
	}
	bool is_open() const override
	{
		return m_open;
	}

	int transfer(i2c_msg* const msgs, const size_t nmsgs) override
	{
		Trx_record rec;
		for(size_t i = 0; i < nmsgs; i++)
		{
			rec.msgs.push_back({msgs[i].addr, msgs[i].flags, msgs[i].len});
		}

		rec.ret = do_transfer(msgs, nmsgs);
		m_trx_log.push_back(rec);

		return rec.ret;
	}

	// fail the transaction at this index in the log
	void fail_trx(const size_t idx, const int err = EREMOTEIO)
	{
		m_fail_at    = idx;
		m_fail_errno = err;
	}
	void set_fail_open(const bool fail)
	{
		m_fail_open = fail;
	}
	void set_device_id(const uint32_t id)
	{
		m_device_id = id;
	}

	bool is_sleeping() const
	{
		return m_sleeping;
	}
	size_t get_open_count() const
	{
		return m_open_count;
	}

	const std::vector<Trx_record>& get_trx_log() const
	{
		return m_trx_log;
	}
	void clear_trx_log()
	{
		m_trx_log.clear();
	}

	std::vector<uint8_t>& get_mem()
	{
		return m_mem;
	}

protected:

	int do_transfer(i2c_msg* const msgs, const size_t nmsgs)
	{
		if(m_fail_at.has_value() && (m_fail_at.value() == m_trx_log.size()))
		{
			return -m_fail_errno;
		}

		if( ! m_open )
		{
			return -EBADF;
		}

		if(nmsgs == 0)
		{
			return -EINVAL;
		}

		for(size_t i = 0; i < nmsgs; i++)
		{
			if(msgs[i].len > MAX_MSG_LEN)
			{
				return -EINVAL;
			}
		}

		// reserved device id address, 0xF8 then our address byte
		if(msgs[0].addr == (0xF8U >> 1))
		{
			if( (msgs[0].flags & I2C_M_RD) || (msgs[0].len != 1) || (((msgs[0].buf[0] >> 1) & 0x7EU) != m_base_addr) )
			{
				return -ENXIO;
			}

			if(m_sleeping)
			{
				return -ENXIO;
			}

			if( (nmsgs == 2) && (msgs[1].addr == (0xF8U >> 1)) && (msgs[1].flags & I2C_M_RD) && (msgs[1].len == 3) )
			{
				msgs[1].buf[0] = (m_device_id >> 16) & 0xFFU;
				msgs[1].buf[1] = (m_device_id >>  8) & 0xFFU;
				msgs[1].buf[2] = (m_device_id >>  0) & 0xFFU;
				return 0;
			}

			if( (nmsgs == 2) && (msgs[1].addr == (0x86U >> 1)) && (msgs[1].len == 0) )
			{
				m_sleeping = true;
				return 0;
			}

			return -EINVAL;
		}

		if( (msgs[0].addr & 0x7EU) != m_base_addr )
		{
			return -ENXIO;
		}

		// address that wakes the device is not acked
		if(m_sleeping)
		{
			m_sleeping = false;
			return -ENXIO;
		}

		const size_t bank = msgs[0].addr & 0x01U;

		for(size_t i = 0; i < nmsgs; i++)
		{
			const i2c_msg& msg = msgs[i];

			if( (i != 0) && ( ! (msg.flags & I2C_M_NOSTART) ) && (msg.addr != msgs[0].addr) )
			{
				return -EINVAL;
			}

			if(msg.flags & I2C_M_RD)
			{
				for(size_t j = 0; j < msg.len; j++)
				{
					msg.buf[j] = m_mem[(bank * BANK_SIZE) + m_counter];
					m_counter  = (m_counter + 1) % BANK_SIZE;
				}
			}
			else
			{
				size_t j = 0;

				// a started write sets the address counter first
				if( ! (msg.flags & I2C_M_NOSTART) )
				{
					if(msg.len < 2)
					{
						// address only, no data
						continue;
					}
					m_counter = (size_t(msg.buf[0]) << 8) | size_t(msg.buf[1]);
					j = 2;
				}

				for(; j < msg.len; j++)
				{
					m_mem[(bank * BANK_SIZE) + m_counter] = msg.buf[j];
					m_counter = (m_counter + 1) % BANK_SIZE;
				}
			}
		}

		return 0;
	}

	uint8_t m_base_addr;

	std::vector<uint8_t> m_mem;
	size_t   m_counter;

	bool     m_open;
	bool     m_sleeping;
	bool     m_fail_open;
	uint32_t m_device_id;
	size_t   m_open_count;

	std::optional<size_t> m_fail_at;
	int m_fail_errno;

	std::vector<Trx_record> m_trx_log;
};
