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

#include "emb-lin-fram/FRAM_status.hpp"

#include <array>
#include <vector>

#include <cstddef>
#include <cstdint>

// State of the A1 and A2 address select pins
struct FM24V10_addr_pins
{
	bool a1;
	bool a2;

	// 2 bit select field, A2 A1
	uint8_t get_sel_bits() const
	{
		return (uint8_t(a2) << 1) | (uint8_t(a1) << 0);
	}
};

// One bus transaction, never crosses a bank
struct FM24V10_trx
{
	enum class DIR : uint8_t
	{
		READ,
		WRITE
	};

	uint8_t  slave_addr; // 7 bit, bank in bit 0
	uint16_t mem_addr;   // A15-A0, offset within the bank
	size_t   size;
	DIR      dir;

	// memory address as sent on the wire, MSB first
	std::array<uint8_t, 2> get_addr_bytes() const
	{
		return {uint8_t((mem_addr & 0xFF00U) >> 8), uint8_t((mem_addr & 0x00FFU) >> 0)};
	}

	// linear offset of the first byte
	size_t get_linear_addr() const
	{
		return (size_t(slave_addr & 0x01U) << 16) | mem_addr;
	}
};

// Cursor over the transactions for one request, produced by FM24V10_addr_resolver::plan
class FM24V10_plan
{
public:
	FM24V10_plan() : m_base_addr(0), m_addr(0), m_remaining(0), m_dir(FM24V10_trx::DIR::READ)
	{

	}

	FM24V10_plan(const uint8_t base_addr, const size_t addr, const size_t size, const FM24V10_trx::DIR dir) :
		m_base_addr(base_addr), m_addr(addr), m_remaining(size), m_dir(dir)
	{

	}

	bool empty() const
	{
		return m_remaining == 0;
	}

	// Produce the next transaction, false once the span is covered
	bool next(FM24V10_trx* const out_trx);

protected:
	uint8_t m_base_addr;
	size_t  m_addr;
	size_t  m_remaining;
	FM24V10_trx::DIR m_dir;
};

// Maps a linear offset in the 1Mbit array to slave address + 16 bit memory address
// The array is split in two 64KiB banks, A16 is carried in bit 0 of the slave address
class FM24V10_addr_resolver
{
public:
	static constexpr uint8_t DEVICE_TYPE_CODE = 0x0AU; // 0b1010

	static constexpr size_t CAPACITY  = 1024*1024 / 8;
	static constexpr size_t BANK_SIZE = 64*1024;
	static constexpr size_t NUM_BANKS = CAPACITY / BANK_SIZE;

	static constexpr size_t MEM_ADDR_SIZE = 2;

	FM24V10_addr_resolver(const FM24V10_addr_pins& pins);

	// 0b1010_A2_A1_0
	uint8_t get_base_addr() const
	{
		return m_base_addr;
	}

	// 0b1010_A2_A1_bank
	uint8_t get_slave_addr(const size_t bank) const
	{
		return m_base_addr | uint8_t(bank & 0x01U);
	}

	// addr must name a byte in the array even for an empty span
	static bool is_valid_span(const size_t addr, const size_t size)
	{
		return (addr < CAPACITY) && (size <= (CAPACITY - addr));
	}

	FRAM_status plan(const size_t addr, const size_t size, const FM24V10_trx::DIR dir, FM24V10_plan* const out_plan) const;

	FRAM_status plan(const size_t addr, const size_t size, const FM24V10_trx::DIR dir, std::vector<FM24V10_trx>* const out_trx) const;

protected:
	uint8_t m_base_addr;
};
