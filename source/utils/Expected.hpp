#pragma once
#include <utility>

namespace b64kit{
namespace utils{

/**
 * @brief Object containing result value on success or error value on failure.(same as std::expected<T, E> in C++23)
 * 
 * @tparam T the type of result value. It must be default constructible.
 * @tparam E the type of error value. It must be default constructible.
 */
template <typename T, typename E>
class Expected
{
	private:
		bool m_isSuccessed;
		T m_value;
		E m_ec;
	public:
		/**
		 * @brief Constructor of Expected<T, E> on success
		 * 
		 * @param value value on success
		 */
		Expected(T value) : m_isSuccessed(true), m_value(std::move(value)), m_ec() {}
		/**
		 * @brief Constructor of Expected<T, E> on failure
		 * 
		 * @param ec value on failure
		 */
		Expected(E ec) : m_isSuccessed(false), m_value(), m_ec(std::move(ec)) {}
		Expected(const Expected&) = default;
		Expected(Expected&&) = default;
		~Expected() = default;
		Expected& operator=(const Expected&) = default;
		Expected& operator=(Expected&&) = default;
		/**
		 * @brief boolean operator.
		 * 
		 * @return true if it has successed.
		 * @return false if it has failed.
		 */
		explicit operator bool() const { return m_isSuccessed; }
		/**
		 * @brief whether it has successed or failed.
		 * 
		 * @return true if it has successed.
		 * @return false if it has failed.
		 */
		bool isSuccessed() const { return m_isSuccessed; }
		T& operator*(){ return m_value; }
		const T& operator*() const { return m_value; }
		T* operator->(){ return &m_value; }
		const T* operator->() const { return &m_value; }
		/**
		 * @brief Get value on success
		 * 
		 * @return T value on success
		 */
		T value() const { return m_value; }
		/**
		 * @brief Get value on failure
		 * 
		 * @return E value on failure
		 */
		E error() const { return m_ec; }
		/**
		 * @brief Get value on success or default value.
		 * 
		 * @param default_value default value to get on failed state.
		 * @return T result
		 */
		T value_or(T default_value) const { return m_isSuccessed ? m_value : default_value; }
		/**
		 * @brief Both should have successed with same value, or both should have failed with same error.
		 * 
		 * @param rhs right hands
		 */
		bool operator==(const Expected& rhs) const
		{
			if(m_isSuccessed == rhs.m_isSuccessed)
				return m_isSuccessed ? m_value == rhs.m_value : m_ec == rhs.m_ec;
			return false;
		}
};

}
}
