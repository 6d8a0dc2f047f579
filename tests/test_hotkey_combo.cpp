// Tests for hotkey combo parsing
// Compile: g++ -std=c++17 -I../include -o test_hotkey_combo test_hotkey_combo.cpp ../src/hotkey_manager.cpp

#include "hotkey_manager.hpp"
#include <iostream>
#include <cassert>
#include <linux/input-event-codes.h>

using namespace voicetype;

void test_single_keys() {
    std::cout << "Testing single keys..." << std::endl;

    std::vector<uint32_t> codes;
    assert(parse_key_combo("KEY_RIGHTALT", codes));
    assert(codes.size() == 1 && codes[0] == KEY_RIGHTALT);

    assert(parse_key_combo("ralt", codes));
    assert(codes.size() == 1 && codes[0] == KEY_RIGHTALT);

    assert(parse_key_combo("100", codes));
    assert(codes.size() == 1 && codes[0] == 100);

    assert(parse_key_combo("F9", codes));
    assert(codes.size() == 1 && codes[0] == KEY_F9);

    assert(parse_key_combo("f12", codes));
    assert(codes[0] == KEY_F12);

    std::cout << "  PASS" << std::endl;
}

void test_letters_follow_layout() {
    std::cout << "Testing letter keys..." << std::endl;

    std::vector<uint32_t> codes;
    assert(parse_key_combo("q", codes) && codes[0] == KEY_Q);
    assert(parse_key_combo("p", codes) && codes[0] == KEY_P);
    assert(parse_key_combo("l", codes) && codes[0] == KEY_L);
    assert(parse_key_combo("V", codes) && codes[0] == KEY_V);
    assert(parse_key_combo("m", codes) && codes[0] == KEY_M);

    std::cout << "  PASS" << std::endl;
}

void test_combos() {
    std::cout << "Testing combinations..." << std::endl;

    std::vector<uint32_t> codes;
    assert(parse_key_combo("ctrl+shift+space", codes));
    assert(codes.size() == 3);
    assert(codes[0] == KEY_LEFTCTRL && codes[1] == KEY_LEFTSHIFT && codes[2] == KEY_SPACE);

    assert(parse_key_combo(" Ctrl + V ", codes));
    assert(codes.size() == 2 && codes[1] == KEY_V);

    // Duplicates collapse
    assert(parse_key_combo("ctrl+control+v", codes));
    assert(codes.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_rejects_bad_input() {
    std::cout << "Testing invalid combos..." << std::endl;

    std::vector<uint32_t> codes;
    assert(!parse_key_combo("", codes));
    assert(!parse_key_combo("ctrl+", codes));
    assert(codes.empty());
    assert(!parse_key_combo("ctrl+nosuchkey", codes));
    assert(!parse_key_combo("0", codes));
    assert(!parse_key_combo("99999", codes));
    assert(!parse_key_combo("f0", codes));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Hotkey Combo Tests ===\n" << std::endl;

    test_single_keys();
    test_letters_follow_layout();
    test_combos();
    test_rejects_bad_input();

    std::cout << "\n=== All hotkey combo tests passed! ===\n" << std::endl;
    return 0;
}
