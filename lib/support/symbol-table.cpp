/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <stdexcept>
#include <fmt/format.h>
#include <ershov/support/symbol-table.hpp>

namespace ershov
{
	SymbolTable::SymbolTable()
	{
		/* id 0 is reserved for the empty spelling so a default
		 * constructed symbol field never aliases a real leaf */
		ids.emplace("", 0);
		spellings.emplace_back();
	}

	SymbolTable::SymbolId SymbolTable::intern(const std::string_view spelling)
	{
		if (spelling.empty())
			return 0;

		if (const auto it = ids.find(spelling);
			it != ids.end())
		{
			return it->second;
		}

		const auto id = static_cast<SymbolId>(spellings.size());
		spellings.emplace_back(spelling);
		ids.emplace(std::string(spelling), id);
		return id;
	}

	std::string_view SymbolTable::get(const SymbolId id) const
	{
		if (id >= spellings.size())
			throw std::out_of_range(fmt::format("SymbolTable::get: invalid symbol id {}", id));
		return spellings[id];
	}

	std::optional<SymbolTable::SymbolId> SymbolTable::find(const std::string_view spelling) const
	{
		if (const auto it = ids.find(spelling);
			it != ids.end())
		{
			return it->second;
		}
		return std::nullopt;
	}

	bool SymbolTable::contains(const std::string_view spelling) const
	{
		return ids.contains(spelling);
	}

	std::size_t SymbolTable::size() const
	{
		return spellings.size();
	}

	void SymbolTable::clear()
	{
		ids.clear();
		spellings.clear();
		ids.emplace("", 0);
		spellings.emplace_back();
	}
}
