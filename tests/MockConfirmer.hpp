#ifndef MOCKCONFIRMER_HPP
#define MOCKCONFIRMER_HPP

#include <gmock/gmock.h>
#include <string>

#include "mailarchive/confirmer.hpp"

class MockConfirmer : public Confirmer {
public:
    MOCK_METHOD(bool, confirm, (const std::string & prompt), (override));
};

#endif // MOCKCONFIRMER_HPP
