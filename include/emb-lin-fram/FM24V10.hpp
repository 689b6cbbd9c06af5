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

#include "emb-lin-fram/FM24V10_addr_resolver.hpp"
#include "emb-lin-fram/FRAM_status.hpp"
#include "emb-lin-fram/I2C_bus_base.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

// Cypress / Infineon FM24V10, 1Mbit I2C F-RAM
//
// The 17 bit memory address is split: A16 selects the bank in bit 0 of the slave address, A15-A0 are sent as two bytes.
// Reads and writes that straddle 0x10000 are issued as two transactions.
// Writes commit as soon as the transaction ends, there is no write cycle to wait out.
// Nothing is retried, a failed transaction is returned as BUS_ERROR and prior transactions are not rolled back.
class FM24V10
{
public:
	// 12bit mf, 4bit density, 4bit sub, 4bit rev
	static constexpr uint32_t DEVICE_ID          = 0x004400U;
	static constexpr uint32_t MF_CODE            = 0x004U;   // Ramtron / Cypress
	static constexpr uint8_t  DENSITY_CODE       = 0x04U;    // 1Mbit

	// reserved slave addresses
	static constexpr uint8_t DEVICE_ID_ADDR      = 0xF8U >> 1;
	static constexpr uint8_t SLEEP_CMD_ADDR      = 0x86U >> 1;

	static constexpr size_t CAPACITY  = FM24V10_addr_resolver::CAPACITY;
	static constexpr size_t BANK_SIZE = FM24V10_addr_resolver::BANK_SIZE;

	// trec, 400us max
	static constexpr std::chrono::microseconds WAKE_RECOVERY_TIME{1000};

	FM24V10(const std::shared_ptr<I2C_bus_base>& bus, const FM24V10_addr_pins& pins);

	// base address as seen by i2cdetect, 0x50, 0x52, 0x54 or 0x56
	// throws std::domain_error for anything else
	FM24V10(const std::shared_ptr<I2C_bus_base>& bus, const long id);

	virtual ~FM24V10();

	std::shared_ptr<I2C_bus_base> get_bus()
	{
		return m_bus;
	}

	const FM24V10_addr_resolver& get_resolver() const
	{
		return m_resolver;
	}

	uint8_t get_base_addr() const
	{
		return m_resolver.get_base_addr();
	}

	uint8_t get_slave_addr(const size_t bank) const
	{
		return m_resolver.get_slave_addr(bank);
	}

	static constexpr size_t get_size()
	{
		return CAPACITY;
	}

	FRAM_status probe();
	FRAM_status read_device_id(uint32_t* const out_id);

	std::optional<uint32_t> get_device_id() const
	{
		return m_device_id;
	}

	FRAM_status sleep();

	// A sleeping part does not ack the waking address, so a NACK is not an error here.
	// This also means wake() returns OK with nothing at the address, probe() afterwards to confirm the part is there.
	FRAM_status wake();

	virtual FRAM_status read(const size_t addr, void* const buf, const size_t size);
	virtual FRAM_status write(const size_t addr, const void* const buf, const size_t size);

	FRAM_status read_byte(const size_t addr, uint8_t* const out_val)
	{
		return read(addr, out_val, 1);
	}

	FRAM_status write_byte(const size_t addr, const uint8_t val)
	{
		return write(addr, &val, 1);
	}

	template<size_t LEN>
	FRAM_status write(const size_t addr, const std::array<uint8_t, LEN>& buf)
	{
		return write(addr, buf.data(), buf.size());
	}

	template<size_t LEN>
	FRAM_status read(const size_t addr, std::array<uint8_t, LEN>* const out_buf)
	{
		return read(addr, out_buf->data(), out_buf->size());
	}

	FRAM_status write(const size_t addr, const std::vector<uint8_t>& buf)
	{
		return write(addr, buf.data(), buf.size());
	}

	FRAM_status read(const size_t addr, std::vector<uint8_t>* const out_buf)
	{
		return read(addr, out_buf->data(), out_buf->size());
	}

	FRAM_status write(const size_t addr, const std::span<const uint8_t>& buf)
	{
		return write(addr, buf.data(), buf.size());
	}

	FRAM_status read(const size_t addr, const std::span<uint8_t>& buf)
	{
		return read(addr, buf.data(), buf.size());
	}

	virtual FRAM_status fill(const uint8_t val);
	virtual FRAM_status erase()
	{
		return fill(0xFF);
	}

protected:

	static FM24V10_addr_pins get_pins_from_id(const long id);

	// runs each trx of the plan in order, dispatching on its direction
	FRAM_status execute_plan(FM24V10_plan* const trx_plan, uint8_t* const rd_buf, const uint8_t* const wr_buf);

	FRAM_status read_trx(const FM24V10_trx& trx, uint8_t* const buf);
	FRAM_status write_trx(const FM24V10_trx& trx, const uint8_t* const buf);

	std::shared_ptr<I2C_bus_base> m_bus;
	FM24V10_addr_resolver m_resolver;

	std::optional<uint32_t> m_device_id;
};
