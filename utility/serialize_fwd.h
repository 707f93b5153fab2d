// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

// Declares member serialization for yas archives: SERIALIZE(m_A, m_B) expands to ar & m_A & m_B
template<typename A, typename... Args>
void ampersand_folded(A& a, Args&... args) {
    (a & ... & args);
}

#define SERIALIZE(...) \
    template<typename Ar__> void serialize(Ar__ &ar__) const { \
        ampersand_folded(ar__, __VA_ARGS__); \
    } \
    template<typename Ar__> void serialize(Ar__ &ar__) { \
        ampersand_folded(ar__, __VA_ARGS__); \
    }
